#include "NearestNeighbors.h"
#include "ImbalanceExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kNoExclusion = std::numeric_limits<size_t>::max();

double squaredDistance(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    for (size_t j = 0; j < a.size(); ++j) {
        const double d = a[j] - b[j];
        sum += d * d;
    }
    return sum;
}
}

NearestNeighbors::NearestNeighbors(size_t nNeighbors, int nJobs)
    : nNeighbors_(nNeighbors), nJobs_(nJobs) {}

void NearestNeighbors::fit(const FeatureMatrix& reference) {
    if (reference.empty()) {
        throw Imbalance::DatasetException("NearestNeighbors requires at least one reference sample");
    }
    const size_t width = reference.front().size();
    for (const auto& row : reference) {
        if (row.size() != width) {
            throw Imbalance::DatasetException("NearestNeighbors reference rows must share one width");
        }
    }
    reference_ = reference;
    width_ = width;
}

int NearestNeighbors::resolveThreads(int nJobs) {
#ifdef USE_OPENMP
    if (nJobs < 0) return std::max(1, omp_get_max_threads());
#endif
    return std::max(1, nJobs);
}

void NearestNeighbors::searchOne(const std::vector<double>& query, size_t k, size_t excluded,
                                 std::vector<size_t>& outIdx, std::vector<double>& outDist) const {
    std::vector<std::pair<double, size_t>> scored;
    scored.reserve(reference_.size());
    for (size_t r = 0; r < reference_.size(); ++r) {
        if (r == excluded) continue;
        scored.emplace_back(squaredDistance(query, reference_[r]), r);
    }

    // pair ordering gives (distance, index) so equal distances keep the lower index first.
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k), scored.end());

    outIdx.resize(k);
    outDist.resize(k);
    for (size_t j = 0; j < k; ++j) {
        outIdx[j] = scored[j].second;
        outDist[j] = std::sqrt(scored[j].first);
    }
}

NeighborResult NearestNeighbors::kneighbors(const FeatureMatrix& queries, size_t k) const {
    if (reference_.empty()) {
        throw Imbalance::DatasetException("NearestNeighbors must be fitted before querying");
    }
    if (k == 0) {
        throw Imbalance::DatasetException("Expected n_neighbors > 0");
    }
    if (k > reference_.size()) {
        throw Imbalance::DatasetException("Expected n_neighbors <= n_samples, but n_samples = " +
                                          std::to_string(reference_.size()) + ", n_neighbors = " + std::to_string(k));
    }
    for (const auto& q : queries) {
        if (q.size() != width_) {
            throw Imbalance::DatasetException("Query has " + std::to_string(q.size()) +
                                              " features, expected " + std::to_string(width_));
        }
    }

    NeighborResult result;
    result.indices.resize(queries.size());
    result.distances.resize(queries.size());

    const long long count = static_cast<long long>(queries.size());
    #ifdef USE_OPENMP
    const int threads = resolveThreads(nJobs_);
    #pragma omp parallel for schedule(static) num_threads(threads)
    #endif
    for (long long q = 0; q < count; ++q) {
        const size_t i = static_cast<size_t>(q);
        searchOne(queries[i], k, kNoExclusion, result.indices[i], result.distances[i]);
    }
    return result;
}

NeighborResult NearestNeighbors::kneighborsOfMembers(const std::vector<size_t>& memberRows, size_t k) const {
    if (reference_.empty()) {
        throw Imbalance::DatasetException("NearestNeighbors must be fitted before querying");
    }
    if (k == 0) {
        throw Imbalance::DatasetException("Expected n_neighbors > 0");
    }
    if (k >= reference_.size()) {
        throw Imbalance::DatasetException("Expected n_neighbors < n_samples when excluding the sample itself, but n_samples = " +
                                          std::to_string(reference_.size()) + ", n_neighbors = " + std::to_string(k));
    }
    for (size_t row : memberRows) {
        if (row >= reference_.size()) {
            throw Imbalance::DatasetException("Member row " + std::to_string(row) + " is out of range");
        }
    }

    NeighborResult result;
    result.indices.resize(memberRows.size());
    result.distances.resize(memberRows.size());

    const long long count = static_cast<long long>(memberRows.size());
    #ifdef USE_OPENMP
    const int threads = resolveThreads(nJobs_);
    #pragma omp parallel for schedule(static) num_threads(threads)
    #endif
    for (long long q = 0; q < count; ++q) {
        const size_t i = static_cast<size_t>(q);
        const size_t row = memberRows[i];
        searchOne(reference_[row], k, row, result.indices[i], result.distances[i]);
    }
    return result;
}
