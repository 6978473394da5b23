#pragma once
#include "ResampleTypes.h"
#include <random>
#include <vector>

/**
 * @brief Binary linear SVM trained with Pegasos stochastic sub-gradient descent.
 * @details Features are standardised internally; the bias is learned as a constant feature.
 */
class LinearSvm {
public:
    explicit LinearSvm(double c = 1.0, int epochs = 50);

    /**
     * @brief Trains on rows of X with targets in {-1, +1}.
     * @pre X is rectangular and signs.size() == X.size().
     * @throws Imbalance::DatasetException when shapes mismatch or a target is not +-1.
     */
    void fit(const FeatureMatrix& X, const std::vector<int>& signs, std::mt19937& rng);

    double decisionFunction(const std::vector<double>& row) const;

    /**
     * @brief Rows lying on or inside the margin: signs[i] * f(X[i]) <= 1 + tolerance.
     */
    std::vector<size_t> supportIndices(const FeatureMatrix& X, const std::vector<int>& signs,
                                       double tolerance = 1e-9) const;

    bool isTrained() const noexcept { return trained_; }
    const std::vector<double>& weights() const noexcept { return weights_; }
    double bias() const noexcept { return bias_; }

private:
    double c_;
    int epochs_;
    bool trained_ = false;
    std::vector<double> mean_;
    std::vector<double> scale_;
    std::vector<double> weights_;
    double bias_ = 0.0;
};
