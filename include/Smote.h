#pragma once
#include "NearestNeighbors.h"
#include "Sampler.h"
#include <cstddef>
#include <random>
#include <string>
#include <vector>

enum class SmoteKind { REGULAR, BORDERLINE1, BORDERLINE2, SVM };

/**
 * @brief Parses regular|borderline1|borderline2|svm.
 * @throws Imbalance::ConfigurationException on unknown names.
 */
SmoteKind parseSmoteKind(const std::string& name);
std::string toString(SmoteKind kind);

struct SmoteOptions {
    // Neighbours used to build synthetic samples.
    size_t k = 5;
    // Neighbours used to decide whether a minority sample is in danger.
    size_t m = 10;
    // Extrapolation step for safe support vectors (svm kind).
    double outStep = 0.5;
    SmoteKind kind = SmoteKind::REGULAR;
    std::string nnMethod = "exact";
    int nJobs = -1;
    double svmC = 1.0;
    int svmEpochs = 50;
};

/**
 * @brief Synthetic Minority Over-sampling Technique and its borderline / SVM variants.
 * @details transform() returns the original rows followed by the synthetic minority rows.
 */
class Smote : public Sampler {
public:
    /**
     * @throws Imbalance::ConfigurationException on invalid ratio or options.
     */
    Smote(SamplerParams params, SmoteOptions options = SmoteOptions{});

    /**
     * @brief Learns class statistics and the number of samples to generate.
     * @throws Imbalance::ConfigurationException when the ratio asks for fewer minority samples than present.
     */
    Smote& fit(const FeatureMatrix& X, const Labels& y) override;

    /**
     * @brief Over-samples the minority class of the fitted data.
     * @throws Imbalance::NotFittedException when (X, y) is not the fitted dataset.
     * @throws Imbalance::DatasetException when the minority class is too small for the neighbourhoods.
     */
    Resampled transform(const FeatureMatrix& X, const Labels& y) override;

    std::string name() const override { return "SMOTE"; }

    const SmoteOptions& options() const noexcept { return options_; }
    size_t samplesToGenerate() const noexcept { return numSamples_; }

private:
    SmoteOptions options_;
    size_t numSamples_ = 0;

    FeatureMatrix makeSamples(const FeatureMatrix& seeds,
                              const FeatureMatrix& pool,
                              const std::vector<std::vector<size_t>>& neighbours,
                              size_t count,
                              double stepSize,
                              std::mt19937& rng) const;

    // Marks rows of X whose m neighbours (self excluded) are mostly (danger) or all (noise) non-minority.
    std::vector<bool> inDangerNoise(const NearestNeighbors& searchX,
                                    const std::vector<size_t>& rows,
                                    const Labels& y,
                                    bool noise) const;

    FeatureMatrix generateRegular(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const;
    FeatureMatrix generateBorderline(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const;
    FeatureMatrix generateSvm(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const;
};
