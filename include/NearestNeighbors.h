#pragma once
#include "ResampleTypes.h"
#include <cstddef>
#include <vector>

struct NeighborResult {
    // indices[q][j] is the reference row of the j-th nearest neighbour of query q.
    std::vector<std::vector<size_t>> indices;
    std::vector<std::vector<double>> distances;
};

/**
 * @brief Exact Euclidean k-nearest-neighbour search over a fitted reference set.
 * @details Neighbours are ordered by ascending distance, ties by ascending reference index.
 *          Queries run in parallel under OpenMP.
 */
class NearestNeighbors {
public:
    /**
     * @param nNeighbors default neighbourhood size used by kneighbors(queries).
     * @param nJobs thread count; -1 uses every available thread.
     */
    explicit NearestNeighbors(size_t nNeighbors = 5, int nJobs = -1);

    void setNeighbors(size_t nNeighbors) noexcept { nNeighbors_ = nNeighbors; }
    size_t neighbors() const noexcept { return nNeighbors_; }

    /**
     * @brief Stores the reference rows.
     * @throws Imbalance::DatasetException when reference is empty or ragged.
     */
    void fit(const FeatureMatrix& reference);

    NeighborResult kneighbors(const FeatureMatrix& queries) const { return kneighbors(queries, nNeighbors_); }

    /**
     * @brief k nearest reference rows of each query row.
     * @pre fit() was called; every query has the reference width.
     * @throws Imbalance::DatasetException when k == 0, k exceeds the reference size or the search is unfitted.
     */
    NeighborResult kneighbors(const FeatureMatrix& queries, size_t k) const;

    /**
     * @brief k nearest neighbours of reference rows, never returning the queried row itself.
     * @details Duplicated rows are still reported as neighbours of each other.
     * @throws Imbalance::DatasetException when k >= reference size or a member index is out of range.
     */
    NeighborResult kneighborsOfMembers(const std::vector<size_t>& memberRows, size_t k) const;

    size_t sampleCount() const noexcept { return reference_.size(); }

    // Resolves -1 (all threads) and clamps to at least one thread.
    static int resolveThreads(int nJobs);

private:
    size_t nNeighbors_;
    int nJobs_;
    FeatureMatrix reference_;
    size_t width_ = 0;

    void searchOne(const std::vector<double>& query, size_t k, size_t excluded,
                   std::vector<size_t>& outIdx, std::vector<double>& outDist) const;
};
