#pragma once
#include "ResampleTypes.h"
#include <functional>
#include <string>

class ResampleReport {
public:
    // Maps a class id to its display name.
    using LabelFormatter = std::function<std::string(int)>;

    static void printDatasetSummary(const std::string& path, size_t rows, size_t features, size_t skipped);
    static void printClassComparison(const ClassCounts& before, const ClassCounts& after, const LabelFormatter& labelName);
    static void printCompletion(const std::string& samplerName, const std::string& outputPath, size_t rowsBefore, size_t rowsAfter);
};
