/**
 * @file test_validation.cpp
 * @brief Unit tests for dataset validation and fingerprinting
 */

#include <gtest/gtest.h>

#include "ImbalanceExceptions.h"
#include "Validation.h"

#include <limits>

TEST(ValidationTest, AcceptsConsistentDataset) {
    const FeatureMatrix X = {{0.0, 1.0}, {2.0, 3.0}, {4.0, 5.0}};
    const Labels y = {0, 1, 0};
    EXPECT_NO_THROW(Validation::checkXY(X, y));
}

TEST(ValidationTest, RejectsEmptyMatrix) {
    EXPECT_THROW(Validation::checkXY({}, {}), Imbalance::DatasetException);
}

TEST(ValidationTest, RejectsLabelCountMismatch) {
    const FeatureMatrix X = {{0.0}, {1.0}};
    const Labels y = {0};
    EXPECT_THROW(Validation::checkXY(X, y), Imbalance::DatasetException);
}

TEST(ValidationTest, RejectsZeroFeatures) {
    const FeatureMatrix X = {{}, {}};
    const Labels y = {0, 1};
    EXPECT_THROW(Validation::checkXY(X, y), Imbalance::DatasetException);
}

TEST(ValidationTest, RejectsRaggedRows) {
    const FeatureMatrix X = {{0.0, 1.0}, {2.0}};
    const Labels y = {0, 1};
    EXPECT_THROW(Validation::checkXY(X, y), Imbalance::DatasetException);
}

TEST(ValidationTest, RejectsNonFiniteValues) {
    const Labels y = {0, 1};
    EXPECT_THROW(Validation::checkXY({{0.0}, {std::numeric_limits<double>::quiet_NaN()}}, y),
                 Imbalance::DatasetException);
    EXPECT_THROW(Validation::checkXY({{std::numeric_limits<double>::infinity()}, {1.0}}, y),
                 Imbalance::DatasetException);
}

TEST(ValidationTest, ErrorMessageCarriesCategory) {
    try {
        Validation::checkXY({{0.0}}, {0, 1});
        FAIL() << "expected DatasetException";
    } catch (const Imbalance::DatasetException& ex) {
        EXPECT_NE(std::string(ex.what()).find("Dataset Error"), std::string::npos);
    }
}

// ---------------------------------------------------------------------------
// fingerprint
// ---------------------------------------------------------------------------

TEST(FingerprintTest, EqualForIdenticalContent) {
    const FeatureMatrix a = {{1.5, -2.0}, {3.25, 4.0}};
    const FeatureMatrix b = a;
    EXPECT_EQ(Validation::fingerprint(a), Validation::fingerprint(b));
}

TEST(FingerprintTest, ChangesWithAnyValue) {
    const FeatureMatrix a = {{1.5, -2.0}, {3.25, 4.0}};
    FeatureMatrix b = a;
    b[1][1] = 4.000001;
    EXPECT_NE(Validation::fingerprint(a), Validation::fingerprint(b));
}

TEST(FingerprintTest, SensitiveToRowOrder) {
    const FeatureMatrix a = {{1.0}, {2.0}};
    const FeatureMatrix b = {{2.0}, {1.0}};
    EXPECT_NE(Validation::fingerprint(a), Validation::fingerprint(b));
}

TEST(FingerprintTest, SensitiveToShape) {
    const FeatureMatrix a = {{1.0, 2.0}};
    const FeatureMatrix b = {{1.0}, {2.0}};
    EXPECT_NE(Validation::fingerprint(a), Validation::fingerprint(b));
}

TEST(FingerprintTest, SignedZerosHashAlike) {
    EXPECT_EQ(Validation::fingerprint({{0.0, 1.0}}), Validation::fingerprint({{-0.0, 1.0}}));
}
