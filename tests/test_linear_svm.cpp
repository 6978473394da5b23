/**
 * @file test_linear_svm.cpp
 * @brief Unit tests for the Pegasos linear SVM used by SVM SMOTE
 */

#include <gtest/gtest.h>

#include "ImbalanceExceptions.h"
#include "LinearSvm.h"

#include <random>
#include <vector>

namespace {

// Two well separated groups along the first axis.
void separableData(FeatureMatrix& X, std::vector<int>& signs) {
    for (int i = 0; i < 10; ++i) {
        X.push_back({3.0 + 0.3 * i, 0.1 * (i % 3)});
        signs.push_back(1);
        X.push_back({-3.0 - 0.3 * i, 0.1 * (i % 4)});
        signs.push_back(-1);
    }
}

} // namespace

TEST(LinearSvmTest, SeparatesLinearlySeparableClasses) {
    FeatureMatrix X;
    std::vector<int> signs;
    separableData(X, signs);

    LinearSvm svm(1.0, 50);
    std::mt19937 rng(3);
    svm.fit(X, signs, rng);

    ASSERT_TRUE(svm.isTrained());
    EXPECT_EQ(svm.weights().size(), 2u);
    for (size_t i = 0; i < X.size(); ++i) {
        EXPECT_GT(signs[i] * svm.decisionFunction(X[i]), 0.0) << "row " << i;
    }
    EXPECT_GT(svm.decisionFunction({10.0, 0.0}), 0.0);
    EXPECT_LT(svm.decisionFunction({-10.0, 0.0}), 0.0);
}

TEST(LinearSvmTest, SupportIndicesLieOnOrInsideMargin) {
    FeatureMatrix X;
    std::vector<int> signs;
    separableData(X, signs);

    LinearSvm svm;
    std::mt19937 rng(11);
    svm.fit(X, signs, rng);

    const std::vector<size_t> support = svm.supportIndices(X, signs);
    std::vector<bool> isSupport(X.size(), false);
    for (size_t idx : support) {
        ASSERT_LT(idx, X.size());
        isSupport[idx] = true;
    }
    for (size_t i = 0; i < X.size(); ++i) {
        const double margin = signs[i] * svm.decisionFunction(X[i]);
        EXPECT_EQ(isSupport[i], margin <= 1.0 + 1e-9) << "row " << i;
    }
}

TEST(LinearSvmTest, SameSeedSameModel) {
    FeatureMatrix X;
    std::vector<int> signs;
    separableData(X, signs);

    LinearSvm a;
    LinearSvm b;
    std::mt19937 rngA(5);
    std::mt19937 rngB(5);
    a.fit(X, signs, rngA);
    b.fit(X, signs, rngB);

    EXPECT_EQ(a.weights(), b.weights());
    EXPECT_DOUBLE_EQ(a.bias(), b.bias());
}

TEST(LinearSvmTest, ConstantFeatureIsTolerated) {
    const FeatureMatrix X = {{1.0, 0.0}, {1.0, 1.0}, {1.0, 4.0}, {1.0, 5.0}};
    const std::vector<int> signs = {-1, -1, 1, 1};

    LinearSvm svm;
    std::mt19937 rng(1);
    svm.fit(X, signs, rng);
    EXPECT_GT(svm.decisionFunction({1.0, 5.0}), svm.decisionFunction({1.0, 0.0}));
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(LinearSvmTest, RejectsInvalidHyperParameters) {
    EXPECT_THROW(LinearSvm(0.0, 10), Imbalance::ConfigurationException);
    EXPECT_THROW(LinearSvm(-1.0, 10), Imbalance::ConfigurationException);
    EXPECT_THROW(LinearSvm(1.0, 0), Imbalance::ConfigurationException);
}

TEST(LinearSvmTest, RejectsInvalidTargets) {
    LinearSvm svm;
    std::mt19937 rng(0);
    EXPECT_THROW(svm.fit({{0.0}, {1.0}}, {1, 0}, rng), Imbalance::DatasetException);
    EXPECT_THROW(svm.fit({{0.0}, {1.0}}, {1}, rng), Imbalance::DatasetException);
    EXPECT_FALSE(svm.isTrained());
}

TEST(LinearSvmTest, ScoringRequiresTraining) {
    LinearSvm svm;
    EXPECT_THROW(svm.decisionFunction({0.0}), Imbalance::NotFittedException);
}
