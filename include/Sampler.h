#pragma once
#include "ResampleTypes.h"
#include <cstdint>
#include <optional>
#include <random>
#include <string>

/**
 * @brief Resampling ratio: automatic balancing or a minority/majority fraction in (0, 1].
 */
class Ratio {
public:
    static Ratio automatic() { return Ratio(true, 0.0); }

    /**
     * @throws Imbalance::ConfigurationException when value > 1 or value <= 0.
     */
    static Ratio fraction(double value);

    /**
     * @brief Parses "auto" or a floating point fraction.
     * @throws Imbalance::ConfigurationException on unknown strings or out-of-range values.
     */
    static Ratio parse(const std::string& text);

    bool isAuto() const noexcept { return auto_; }
    double value() const noexcept { return value_; }
    std::string toString() const;

private:
    Ratio(bool isAuto, double value) : auto_(isAuto), value_(value) {}

    bool auto_;
    double value_;
};

struct SamplerParams {
    Ratio ratio = Ratio::automatic();
    std::optional<uint32_t> randomState;
    bool verbose = true;
};

/**
 * @brief Common fit/transform contract shared by every resampling estimator.
 * @details fit() learns the class statistics of a dataset; transform() resamples that same dataset.
 */
class Sampler {
public:
    explicit Sampler(SamplerParams params);
    virtual ~Sampler() = default;

    /**
     * @brief Finds the class statistics of (X, y).
     * @pre X/y pass Validation::checkXY.
     * @post minorityClass(), majorityClass() and classStats() describe y.
     * @throws Imbalance::DatasetException on invalid input or when a single class is present.
     */
    virtual Sampler& fit(const FeatureMatrix& X, const Labels& y);

    /**
     * @brief Resamples the dataset passed to fit().
     * @throws Imbalance::NotFittedException when called before fit() or on different data.
     */
    virtual Resampled transform(const FeatureMatrix& X, const Labels& y) = 0;

    Resampled fitTransform(const FeatureMatrix& X, const Labels& y);

    virtual std::string name() const = 0;

    bool isFitted() const noexcept { return fitted_; }
    int minorityClass() const noexcept { return minorityClass_; }
    int majorityClass() const noexcept { return majorityClass_; }
    const ClassCounts& classStats() const noexcept { return classStats_; }

    const Ratio& ratio() const noexcept { return params_.ratio; }
    const std::optional<uint32_t>& randomState() const noexcept { return params_.randomState; }
    bool verbose() const noexcept { return params_.verbose; }

protected:
    /**
     * @brief Rejects transform() input that was not fitted.
     * @throws Imbalance::NotFittedException.
     */
    void checkTransformInput(const FeatureMatrix& X) const;

    // Seeded from randomState when set, from std::random_device otherwise.
    std::mt19937 makeEngine() const;

    // "[Imbalance][<name>] " prefix for console traces.
    std::string logTag() const;

private:
    SamplerParams params_;
    bool fitted_ = false;
    int minorityClass_ = 0;
    int majorityClass_ = 0;
    ClassCounts classStats_;
    size_t fittedRows_ = 0;
    size_t fittedCols_ = 0;
    uint64_t fittedFingerprint_ = 0;
};
