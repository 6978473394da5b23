/**
 * @file test_edited_nearest_neighbours.cpp
 * @brief Unit tests for Edited Nearest Neighbours cleaning
 */

#include <gtest/gtest.h>

#include "EditedNearestNeighbours.h"
#include "ImbalanceExceptions.h"
#include "test_helpers.h"

using test_helpers::countLabel;

namespace {

SamplerParams quiet() {
    SamplerParams p;
    p.verbose = false;
    return p;
}

EnnOptions selection(EnnSelection kind) {
    EnnOptions o;
    o.kindSel = kind;
    return o;
}

// Majority 0..5 on a line; one minority sample sits next to the end of it.
//   row 4 (x=4) sees {3, 5, 5.9}: two majority, one minority
//   row 5 (x=5) sees {5.9, 4, 3}: two majority, one minority
//   rows 0..3 see only majority.
Resampled borderData() {
    Resampled data;
    for (int i = 0; i <= 5; ++i) {
        data.first.push_back({static_cast<double>(i)});
        data.second.push_back(0);
    }
    for (double x : {5.9, 30.0, 31.0, 32.0}) {
        data.first.push_back({x});
        data.second.push_back(1);
    }
    return data;
}

} // namespace

TEST(EnnSelectionTest, ParsesNames) {
    EXPECT_EQ(parseEnnSelection("all"), EnnSelection::ALL);
    EXPECT_EQ(parseEnnSelection("MODE"), EnnSelection::MODE);
    EXPECT_EQ(toString(EnnSelection::MODE), "mode");
    EXPECT_THROW(parseEnnSelection("majority"), Imbalance::ConfigurationException);
}

TEST(EditedNearestNeighboursTest, RejectsInvalidOptions) {
    EnnOptions zero;
    zero.sizeNgh = 0;
    EXPECT_THROW(EditedNearestNeighbours(quiet(), zero), Imbalance::ConfigurationException);

    EnnOptions jobs;
    jobs.nJobs = -2;
    EXPECT_THROW(EditedNearestNeighbours(quiet(), jobs), Imbalance::ConfigurationException);
}

TEST(EditedNearestNeighboursTest, AllRemovesAnyDisagreement) {
    const Resampled data = borderData();
    EditedNearestNeighbours enn(quiet(), selection(EnnSelection::ALL));
    const Resampled out = enn.fitTransform(data.first, data.second);

    const FeatureMatrix expectedX = {{5.9}, {30.0}, {31.0}, {32.0}, {0.0}, {1.0}, {2.0}, {3.0}};
    const Labels expectedY = {1, 1, 1, 1, 0, 0, 0, 0};
    EXPECT_EQ(out.first, expectedX);
    EXPECT_EQ(out.second, expectedY);
}

TEST(EditedNearestNeighboursTest, ModeKeepsMajorityAgreement) {
    const Resampled data = borderData();
    EditedNearestNeighbours enn(quiet(), selection(EnnSelection::MODE));
    const Resampled out = enn.fitTransform(data.first, data.second);

    EXPECT_EQ(out.first.size(), data.first.size());
    EXPECT_EQ(countLabel(out.second, 0), 6u);
    EXPECT_EQ(countLabel(out.second, 1), 4u);
}

TEST(EditedNearestNeighboursTest, MinorityIsNeverRemoved) {
    // Every minority sample is surrounded by majority samples.
    Resampled data;
    for (int i = 0; i < 12; ++i) {
        data.first.push_back({static_cast<double>(i)});
        data.second.push_back(0);
    }
    for (double x : {2.5, 6.5, 9.5}) {
        data.first.push_back({x});
        data.second.push_back(1);
    }

    EditedNearestNeighbours enn(quiet());
    const Resampled out = enn.fitTransform(data.first, data.second);
    EXPECT_EQ(countLabel(out.second, 1), 3u);
    EXPECT_LT(countLabel(out.second, 0), 12u);
}

TEST(EditedNearestNeighboursTest, ModeTiesFavourSmallestClass) {
    // With size_ngh=2, x=10 (class 2) sees classes {0, 2} and x=30 (class 1) sees classes {1, 2}.
    Resampled data;
    data.first = {{10.0}, {9.0}, {11.0}, {30.0}, {29.0}, {31.0}, {0.0}, {0.5}, {1.0},
                  {50.0}, {60.0}, {60.5}, {100.0}, {101.0}};
    data.second = {2, 0, 2, 1, 1, 2, 0, 0, 0, 2, 1, 1, 5, 5};

    EnnOptions o = selection(EnnSelection::MODE);
    o.sizeNgh = 2;
    EditedNearestNeighbours enn(quiet(), o);
    const Resampled out = enn.fitTransform(data.first, data.second);
    ASSERT_EQ(enn.minorityClass(), 5);

    bool sawTenAsTwo = false;
    bool sawThirtyAsOne = false;
    for (size_t i = 0; i < out.first.size(); ++i) {
        if (out.first[i][0] == 10.0 && out.second[i] == 2) sawTenAsTwo = true;
        if (out.first[i][0] == 30.0 && out.second[i] == 1) sawThirtyAsOne = true;
    }
    EXPECT_FALSE(sawTenAsTwo);
    EXPECT_TRUE(sawThirtyAsOne);
    EXPECT_EQ(countLabel(out.second, 5), 2u);
}

TEST(EditedNearestNeighboursTest, WellSeparatedClassesAreKept) {
    const Resampled data = test_helpers::makeBlobs(30, 10, 20.0);
    EditedNearestNeighbours enn(quiet());
    const Resampled out = enn.fitTransform(data.first, data.second);
    EXPECT_EQ(out.first.size(), data.first.size());
    EXPECT_EQ(countLabel(out.second, 1), 10u);
}

TEST(EditedNearestNeighboursTest, TransformBeforeFitThrows) {
    const Resampled data = borderData();
    EditedNearestNeighbours enn(quiet());
    EXPECT_THROW(enn.transform(data.first, data.second), Imbalance::NotFittedException);
}

TEST(EditedNearestNeighboursTest, NeighbourhoodLargerThanDatasetIsRejected) {
    const Resampled data = borderData();
    EnnOptions o;
    o.sizeNgh = data.first.size();
    EditedNearestNeighbours enn(quiet(), o);
    EXPECT_THROW(enn.fitTransform(data.first, data.second), Imbalance::DatasetException);
}
