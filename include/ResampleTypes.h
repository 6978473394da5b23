#pragma once
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

// Row-major feature storage: FeatureMatrix[i] is sample i.
using FeatureMatrix = std::vector<std::vector<double>>;
using Labels = std::vector<int>;
using Resampled = std::pair<FeatureMatrix, Labels>;

// Occurrences per class id, ordered by class id.
using ClassCounts = std::map<int, size_t>;
