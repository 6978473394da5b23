#include "ResampleReport.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>

void ResampleReport::printDatasetSummary(const std::string& path, size_t rows, size_t features, size_t skipped) {
    std::cout << "\n============================================ DATASET SUMMARY ===============================================\n";
    std::cout << std::left << std::setw(16) << "File" << path << "\n"
              << std::setw(16) << "Rows" << rows << "\n"
              << std::setw(16) << "Features" << features << "\n"
              << std::setw(16) << "Skipped rows" << skipped << "\n";
    std::cout << "============================================================================================================\n";
}

void ResampleReport::printClassComparison(const ClassCounts& before, const ClassCounts& after, const LabelFormatter& labelName) {
    std::set<int> classes;
    for (const auto& kv : before) classes.insert(kv.first);
    for (const auto& kv : after) classes.insert(kv.first);

    size_t totalBefore = 0;
    size_t totalAfter = 0;
    for (const auto& kv : before) totalBefore += kv.second;
    for (const auto& kv : after) totalAfter += kv.second;

    size_t maxNameLen = 10;
    for (int c : classes) maxNameLen = std::max(maxNameLen, labelName(c).length());
    const int w = static_cast<int>(maxNameLen) + 2;

    auto countOf = [](const ClassCounts& counts, int c) {
        const auto it = counts.find(c);
        return it == counts.end() ? size_t{0} : it->second;
    };
    auto share = [](size_t n, size_t total) {
        return total == 0 ? 0.0 : 100.0 * static_cast<double>(n) / static_cast<double>(total);
    };

    std::cout << "\n============================================ CLASS BALANCE =================================================\n";
    std::cout << std::left
              << std::setw(w) << "Class"
              << std::setw(12) << "Before"
              << std::setw(12) << "Share"
              << std::setw(12) << "After"
              << std::setw(12) << "Share"
              << "Delta\n";
    std::cout << std::string(w + 12 * 4 + 8, '-') << "\n";

    for (int c : classes) {
        const size_t b = countOf(before, c);
        const size_t a = countOf(after, c);
        const long long delta = static_cast<long long>(a) - static_cast<long long>(b);
        std::cout << std::left << std::setw(w) << labelName(c)
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(10) << b << "  "
                  << std::setw(9) << share(b, totalBefore) << "%  "
                  << std::setw(10) << a << "  "
                  << std::setw(9) << share(a, totalAfter) << "%  "
                  << std::showpos << delta << std::noshowpos << "\n";
    }
    std::cout << std::left << std::setw(w) << "Total"
              << std::right << std::setw(10) << totalBefore << std::setw(14) << " "
              << std::setw(10) << totalAfter << "\n";
    std::cout << "============================================================================================================\n";
}

void ResampleReport::printCompletion(const std::string& samplerName, const std::string& outputPath, size_t rowsBefore, size_t rowsAfter) {
    std::cout << "\n[Imbalance] " << samplerName << " resampling complete: " << rowsBefore << " -> " << rowsAfter << " rows.\n";
    std::cout << "[Imbalance] Resampled dataset written to " << outputPath << "\n";
}
