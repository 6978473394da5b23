#pragma once

#include "ResampleTypes.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace test_helpers {

// Two Gaussian blobs: majority (label 0) around the origin, minority (label 1) around (separation, separation).
inline Resampled makeBlobs(size_t nMajority, size_t nMinority, double separation = 10.0, uint32_t seed = 7) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    Resampled data;
    for (size_t i = 0; i < nMajority; ++i) {
        data.first.push_back({noise(rng), noise(rng)});
        data.second.push_back(0);
    }
    for (size_t i = 0; i < nMinority; ++i) {
        data.first.push_back({separation + noise(rng), separation + noise(rng)});
        data.second.push_back(1);
    }
    return data;
}

inline size_t countLabel(const Labels& y, int label) {
    return static_cast<size_t>(std::count(y.begin(), y.end(), label));
}

// Scratch file under the system temp directory, created on construction (even when empty)
// and removed on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& name, const std::string& content = "")
        : path_(std::filesystem::temp_directory_path() / ("imbalance_test_" + name)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace test_helpers
