#pragma once
#include "EditedNearestNeighbours.h"
#include "Sampler.h"
#include "Smote.h"
#include <cstddef>
#include <string>

struct SmoteEnnOptions {
    size_t k = 5;
    size_t m = 10;
    double outStep = 0.5;
    SmoteKind kindSmote = SmoteKind::REGULAR;
    std::string nnMethod = "exact";
    size_t sizeNgh = 3;
    EnnSelection kindEnn = EnnSelection::ALL;
    int nJobs = -1;
    // Only read by the svm kind of SMOTE.
    double svmC = 1.0;
    int svmEpochs = 50;
};

/**
 * @brief Over-sampling with SMOTE followed by cleaning with Edited Nearest Neighbours.
 * @details Batista, Prati, Monard. "A study of the behavior of several methods for balancing
 *          machine learning training data", ACM SIGKDD Explorations 6 (1), 2004.
 *          Only binary problems are supported.
 */
class SmoteEnn : public Sampler {
public:
    /**
     * @brief Builds the SMOTE and ENN stages from the forwarded options.
     * @throws Imbalance::ConfigurationException on invalid ratio or options.
     */
    SmoteEnn(SamplerParams params, SmoteEnnOptions options = SmoteEnnOptions{});

    /**
     * @brief Finds the class statistics, then fits the SMOTE stage on (X, y).
     * @throws Imbalance::DatasetException when X and y are inconsistent.
     */
    SmoteEnn& fit(const FeatureMatrix& X, const Labels& y) override;

    /**
     * @brief SMOTE-transforms (X, y) and returns ENN.fitTransform of the result.
     * @throws Imbalance::DatasetException when X and y are inconsistent.
     * @throws Imbalance::NotFittedException when (X, y) is not the fitted dataset.
     */
    Resampled transform(const FeatureMatrix& X, const Labels& y) override;

    std::string name() const override { return "SMOTE+ENN"; }

    const Smote& smote() const noexcept { return smote_; }
    const EditedNearestNeighbours& enn() const noexcept { return enn_; }

private:
    Smote smote_;
    EditedNearestNeighbours enn_;
};
