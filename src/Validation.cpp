#include "Validation.h"
#include "ImbalanceExceptions.h"
#include <cmath>
#include <cstring>
#include <string>

namespace Validation {

void checkXY(const FeatureMatrix& X, const Labels& y) {
    if (X.empty()) {
        throw Imbalance::DatasetException("Found array with 0 sample(s); at least one is required");
    }
    if (X.size() != y.size()) {
        throw Imbalance::DatasetException("Inconsistent numbers of samples: X has " + std::to_string(X.size()) +
                                          " rows but y has " + std::to_string(y.size()) + " labels");
    }

    const size_t width = X.front().size();
    if (width == 0) {
        throw Imbalance::DatasetException("Found array with 0 feature(s); at least one is required");
    }

    for (size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != width) {
            throw Imbalance::DatasetException("Row " + std::to_string(i) + " has " + std::to_string(X[i].size()) +
                                              " features, expected " + std::to_string(width));
        }
        for (size_t j = 0; j < width; ++j) {
            if (!std::isfinite(X[i][j])) {
                throw Imbalance::DatasetException("Input contains NaN or infinity at row " + std::to_string(i) +
                                                  ", column " + std::to_string(j));
            }
        }
    }
}

uint64_t fingerprint(const FeatureMatrix& X) {
    constexpr uint64_t kOffset = 14695981039346656037ULL;
    constexpr uint64_t kPrime = 1099511628211ULL;

    uint64_t h = kOffset;
    auto mix = [&](const unsigned char* bytes, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            h ^= bytes[i];
            h *= kPrime;
        }
    };

    const uint64_t rows = X.size();
    mix(reinterpret_cast<const unsigned char*>(&rows), sizeof(rows));
    for (const auto& row : X) {
        const uint64_t cols = row.size();
        mix(reinterpret_cast<const unsigned char*>(&cols), sizeof(cols));
        for (double v : row) {
            // +0.0 and -0.0 compare equal, hash them the same way.
            const double canonical = (v == 0.0) ? 0.0 : v;
            unsigned char raw[sizeof(double)];
            std::memcpy(raw, &canonical, sizeof(double));
            mix(raw, sizeof(double));
        }
    }
    return h;
}

} // namespace Validation
