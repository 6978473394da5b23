#include "LinearSvm.h"
#include "ImbalanceExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

LinearSvm::LinearSvm(double c, int epochs) : c_(c), epochs_(epochs) {
    if (!(c_ > 0.0)) throw Imbalance::ConfigurationException("svm C must be > 0");
    if (epochs_ < 1) throw Imbalance::ConfigurationException("svm epochs must be >= 1");
}

void LinearSvm::fit(const FeatureMatrix& X, const std::vector<int>& signs, std::mt19937& rng) {
    if (X.empty() || X.size() != signs.size()) {
        throw Imbalance::DatasetException("LinearSvm expects one target per sample");
    }
    const size_t n = X.size();
    const size_t p = X.front().size();
    for (size_t i = 0; i < n; ++i) {
        if (X[i].size() != p) throw Imbalance::DatasetException("LinearSvm rows must share one width");
        if (signs[i] != 1 && signs[i] != -1) {
            throw Imbalance::DatasetException("LinearSvm target at row " + std::to_string(i) + " is not +1/-1");
        }
    }

    mean_.assign(p, 0.0);
    scale_.assign(p, 0.0);
    for (const auto& row : X) {
        for (size_t j = 0; j < p; ++j) mean_[j] += row[j];
    }
    for (size_t j = 0; j < p; ++j) mean_[j] /= static_cast<double>(n);
    for (const auto& row : X) {
        for (size_t j = 0; j < p; ++j) {
            const double d = row[j] - mean_[j];
            scale_[j] += d * d;
        }
    }
    for (size_t j = 0; j < p; ++j) {
        scale_[j] = std::sqrt(scale_[j] / static_cast<double>(std::max<size_t>(1, n - 1)));
        if (scale_[j] < 1e-12) scale_[j] = 1.0;
    }

    FeatureMatrix Z(n, std::vector<double>(p + 1, 1.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < p; ++j) Z[i][j] = (X[i][j] - mean_[j]) / scale_[j];
    }

    const double lambda = 1.0 / (c_ * static_cast<double>(n));
    const double radius = 1.0 / std::sqrt(lambda);
    std::vector<double> w(p + 1, 0.0);
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    size_t t = 0;
    for (int epoch = 0; epoch < epochs_; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng);
        for (size_t idx : order) {
            ++t;
            const double eta = 1.0 / (lambda * static_cast<double>(t));
            const auto& z = Z[idx];
            const double yi = static_cast<double>(signs[idx]);
            const double margin = yi * std::inner_product(w.begin(), w.end(), z.begin(), 0.0);

            const double shrink = 1.0 - eta * lambda;
            for (double& wj : w) wj *= shrink;
            if (margin < 1.0) {
                for (size_t j = 0; j <= p; ++j) w[j] += eta * yi * z[j];
            }

            const double norm = std::sqrt(std::inner_product(w.begin(), w.end(), w.begin(), 0.0));
            if (norm > radius) {
                const double f = radius / norm;
                for (double& wj : w) wj *= f;
            }
        }
    }

    bias_ = w[p];
    w.pop_back();
    weights_ = std::move(w);
    trained_ = true;
}

double LinearSvm::decisionFunction(const std::vector<double>& row) const {
    if (!trained_) throw Imbalance::NotFittedException("LinearSvm must be fitted before scoring");
    if (row.size() != weights_.size()) {
        throw Imbalance::DatasetException("LinearSvm expected " + std::to_string(weights_.size()) + " features");
    }
    double score = bias_;
    for (size_t j = 0; j < row.size(); ++j) {
        score += weights_[j] * (row[j] - mean_[j]) / scale_[j];
    }
    return score;
}

std::vector<size_t> LinearSvm::supportIndices(const FeatureMatrix& X, const std::vector<int>& signs,
                                              double tolerance) const {
    if (X.size() != signs.size()) {
        throw Imbalance::DatasetException("LinearSvm expects one target per sample");
    }
    std::vector<size_t> support;
    for (size_t i = 0; i < X.size(); ++i) {
        if (static_cast<double>(signs[i]) * decisionFunction(X[i]) <= 1.0 + tolerance) {
            support.push_back(i);
        }
    }
    return support;
}
