/**
 * @file test_nearest_neighbors.cpp
 * @brief Unit tests for exact k-nearest-neighbour search
 */

#include <gtest/gtest.h>

#include "ImbalanceExceptions.h"
#include "NearestNeighbors.h"
#include "test_helpers.h"

#include <vector>

TEST(NearestNeighborsTest, OrdersByDistance) {
    NearestNeighbors nn(2);
    nn.fit({{0.0}, {1.0}, {2.0}, {3.0}, {10.0}});

    const NeighborResult r = nn.kneighbors({{2.1}});
    ASSERT_EQ(r.indices.size(), 1u);
    EXPECT_EQ(r.indices[0], (std::vector<size_t>{2, 3}));
    EXPECT_NEAR(r.distances[0][0], 0.1, 1e-12);
    EXPECT_NEAR(r.distances[0][1], 0.9, 1e-12);
}

TEST(NearestNeighborsTest, TiesBreakByIndex) {
    NearestNeighbors nn;
    nn.fit({{2.0}, {0.0}, {4.0}});

    const NeighborResult r = nn.kneighbors({{1.0}, {3.0}}, 2);
    EXPECT_EQ(r.indices[0], (std::vector<size_t>{0, 1}));
    EXPECT_EQ(r.indices[1], (std::vector<size_t>{0, 2}));
}

TEST(NearestNeighborsTest, EuclideanDistanceInSeveralDimensions) {
    NearestNeighbors nn;
    nn.fit({{0.0, 0.0}, {3.0, 4.0}});

    const NeighborResult r = nn.kneighbors({{0.0, 0.0}}, 2);
    EXPECT_DOUBLE_EQ(r.distances[0][0], 0.0);
    EXPECT_DOUBLE_EQ(r.distances[0][1], 5.0);
}

TEST(NearestNeighborsTest, MemberQueriesExcludeThemselves) {
    NearestNeighbors nn;
    nn.fit({{0.0}, {1.0}, {2.0}, {7.0}});

    const NeighborResult r = nn.kneighborsOfMembers({1, 3}, 2);
    EXPECT_EQ(r.indices[0], (std::vector<size_t>{0, 2}));
    EXPECT_EQ(r.indices[1], (std::vector<size_t>{2, 1}));
    for (const auto& row : r.indices) {
        EXPECT_EQ(row.size(), 2u);
    }
}

TEST(NearestNeighborsTest, DuplicatesStillNeighbourEachOther) {
    NearestNeighbors nn;
    nn.fit({{5.0, 5.0}, {5.0, 5.0}, {9.0, 9.0}});

    const NeighborResult r = nn.kneighborsOfMembers({0, 1}, 1);
    EXPECT_EQ(r.indices[0][0], 1u);
    EXPECT_EQ(r.indices[1][0], 0u);
    EXPECT_DOUBLE_EQ(r.distances[0][0], 0.0);
}

TEST(NearestNeighborsTest, ThreadCountDoesNotChangeResults) {
    const Resampled data = test_helpers::makeBlobs(60, 20, 3.0);

    NearestNeighbors serial(4, 1);
    NearestNeighbors parallel(4, -1);
    serial.fit(data.first);
    parallel.fit(data.first);

    std::vector<size_t> members(data.first.size());
    for (size_t i = 0; i < members.size(); ++i) members[i] = i;

    EXPECT_EQ(serial.kneighbors(data.first).indices, parallel.kneighbors(data.first).indices);
    EXPECT_EQ(serial.kneighborsOfMembers(members, 4).indices, parallel.kneighborsOfMembers(members, 4).indices);
}

TEST(NearestNeighborsTest, ResolvesThreadCount) {
    EXPECT_EQ(NearestNeighbors::resolveThreads(3), 3);
    EXPECT_GE(NearestNeighbors::resolveThreads(-1), 1);
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(NearestNeighborsTest, RejectsInvalidReference) {
    NearestNeighbors nn;
    EXPECT_THROW(nn.fit({}), Imbalance::DatasetException);
    EXPECT_THROW(nn.fit({{0.0, 1.0}, {2.0}}), Imbalance::DatasetException);
}

TEST(NearestNeighborsTest, RejectsQueriesBeforeFit) {
    NearestNeighbors nn;
    EXPECT_THROW(nn.kneighbors({{0.0}}, 1), Imbalance::DatasetException);
    EXPECT_THROW(nn.kneighborsOfMembers({0}, 1), Imbalance::DatasetException);
}

TEST(NearestNeighborsTest, RejectsInvalidNeighbourCounts) {
    NearestNeighbors nn;
    nn.fit({{0.0}, {1.0}, {2.0}});

    EXPECT_THROW(nn.kneighbors({{0.0}}, 0), Imbalance::DatasetException);
    EXPECT_THROW(nn.kneighbors({{0.0}}, 4), Imbalance::DatasetException);
    EXPECT_NO_THROW(nn.kneighbors({{0.0}}, 3));

    EXPECT_THROW(nn.kneighborsOfMembers({0}, 3), Imbalance::DatasetException);
    EXPECT_NO_THROW(nn.kneighborsOfMembers({0}, 2));
}

TEST(NearestNeighborsTest, RejectsBadQueries) {
    NearestNeighbors nn;
    nn.fit({{0.0, 0.0}, {1.0, 1.0}});

    EXPECT_THROW(nn.kneighbors({{0.0}}, 1), Imbalance::DatasetException);
    EXPECT_THROW(nn.kneighborsOfMembers({2}, 1), Imbalance::DatasetException);
}
