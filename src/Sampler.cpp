#include "Sampler.h"
#include "CommonUtils.h"
#include "ImbalanceExceptions.h"
#include "Validation.h"
#include <iostream>
#include <sstream>

Ratio Ratio::fraction(double value) {
    if (value > 1.0) {
        throw Imbalance::ConfigurationException("ratio cannot be greater than one");
    }
    if (!(value > 0.0)) {
        throw Imbalance::ConfigurationException("ratio must be strictly positive");
    }
    return Ratio(false, value);
}

Ratio Ratio::parse(const std::string& text) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(text));
    if (v == "auto") return automatic();

    double parsed = 0.0;
    try {
        size_t pos = 0;
        parsed = std::stod(v, &pos);
        if (pos != v.size()) {
            throw Imbalance::ConfigurationException("unknown value for ratio: " + text);
        }
    } catch (const Imbalance::ImbalanceException&) {
        throw;
    } catch (const std::exception&) {
        throw Imbalance::ConfigurationException("unknown value for ratio: " + text);
    }
    return fraction(parsed);
}

std::string Ratio::toString() const {
    if (auto_) return "auto";
    std::ostringstream out;
    out << value_;
    return out.str();
}

Sampler::Sampler(SamplerParams params) : params_(std::move(params)) {}

Sampler& Sampler::fit(const FeatureMatrix& X, const Labels& y) {
    Validation::checkXY(X, y);

    if (params_.verbose) std::cout << logTag() << "Determining classes statistics...\n";

    ClassCounts counts;
    std::vector<int> appearance;
    for (int label : y) {
        if (counts[label]++ == 0) appearance.push_back(label);
    }

    if (counts.size() <= 1) {
        throw Imbalance::DatasetException("Only one class detected, aborting");
    }

    // Ties resolve to the class seen first in y.
    int minClass = appearance.front();
    int maxClass = appearance.front();
    for (int label : appearance) {
        if (counts[label] < counts[minClass]) minClass = label;
        if (counts[label] > counts[maxClass]) maxClass = label;
    }

    classStats_ = std::move(counts);
    minorityClass_ = minClass;
    majorityClass_ = maxClass;
    fittedRows_ = X.size();
    fittedCols_ = X.front().size();
    fittedFingerprint_ = Validation::fingerprint(X);
    fitted_ = true;

    if (params_.verbose) {
        std::cout << logTag() << classStats_.size() << " classes detected: "
                  << CommonUtils::formatClassCounts(classStats_) << "\n";
    }
    if (classStats_.size() > 2) {
        std::cerr << logTag() << "Warning: only binary classification is supported; "
                  << "minority=" << minorityClass_ << ", majority=" << majorityClass_ << "\n";
    }
    return *this;
}

Resampled Sampler::fitTransform(const FeatureMatrix& X, const Labels& y) {
    fit(X, y);
    return transform(X, y);
}

void Sampler::checkTransformInput(const FeatureMatrix& X) const {
    if (!fitted_) {
        throw Imbalance::NotFittedException(name() + " must be fitted before calling transform");
    }
    const size_t cols = X.empty() ? 0 : X.front().size();
    if (X.size() != fittedRows_ || cols != fittedCols_ || Validation::fingerprint(X) != fittedFingerprint_) {
        throw Imbalance::NotFittedException(
            "The data passed to transform do not match the data that were fitted (" +
            std::to_string(fittedRows_) + "x" + std::to_string(fittedCols_) + " expected)");
    }
}

std::mt19937 Sampler::makeEngine() const {
    if (params_.randomState) return std::mt19937(*params_.randomState);
    std::random_device rd;
    return std::mt19937(rd());
}

std::string Sampler::logTag() const {
    return "[Imbalance][" + name() + "] ";
}
