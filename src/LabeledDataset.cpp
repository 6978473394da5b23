#include "LabeledDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "ImbalanceExceptions.h"
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

LabeledDataset::LabeledDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

bool LabeledDataset::parseDouble(const std::string& v, double& out) {
    std::string cleaned = CommonUtils::trim(v);
    if (CommonUtils::isMissingToken(cleaned)) return false;
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

void LabeledDataset::load(const std::string& targetColumn) {
    std::ifstream file(filename_, std::ios::binary);
    if (!file) {
        throw Imbalance::IOException("Could not open dataset: " + filename_);
    }
    CSVUtils::skipBOM(file);

    bool malformed = false;
    const std::vector<std::string> header = CSVUtils::normalizeHeader(CSVUtils::parseCSVLine(file, delimiter_, &malformed));
    if (header.empty() || malformed) {
        throw Imbalance::DatasetException("Missing or malformed header in " + filename_);
    }
    if (header.size() < 2) {
        throw Imbalance::DatasetException("Dataset needs at least one feature column and one label column");
    }

    if (targetColumn.empty()) {
        targetIndex_ = header.size() - 1;
    } else {
        const std::string wanted = CommonUtils::toLower(CommonUtils::trim(targetColumn));
        bool found = false;
        for (size_t i = 0; i < header.size(); ++i) {
            if (CommonUtils::toLower(header[i]) == wanted) {
                targetIndex_ = i;
                found = true;
                break;
            }
        }
        if (!found) {
            throw Imbalance::DatasetException("Label column '" + targetColumn + "' not found in " + filename_);
        }
    }

    targetName_ = header[targetIndex_];
    featureNames_.clear();
    for (size_t i = 0; i < header.size(); ++i) {
        if (i != targetIndex_) featureNames_.push_back(header[i]);
    }

    FeatureMatrix rows;
    std::vector<std::string> rawLabels;
    skippedRows_ = 0;

    while (file.peek() != EOF) {
        bool rowMalformed = false;
        const std::vector<std::string> fields = CSVUtils::parseCSVLine(file, delimiter_, &rowMalformed);
        if (fields.empty() && !rowMalformed) continue;
        if (rowMalformed || fields.size() != header.size()) {
            ++skippedRows_;
            continue;
        }

        std::vector<double> row;
        row.reserve(featureNames_.size());
        bool usable = !CommonUtils::isMissingToken(fields[targetIndex_]);
        for (size_t i = 0; i < fields.size() && usable; ++i) {
            if (i == targetIndex_) continue;
            double value = 0.0;
            if (!parseDouble(fields[i], value)) {
                usable = false;
                break;
            }
            row.push_back(value);
        }
        if (!usable) {
            ++skippedRows_;
            continue;
        }
        rows.push_back(std::move(row));
        rawLabels.push_back(CommonUtils::trim(fields[targetIndex_]));
    }

    if (rows.empty()) {
        throw Imbalance::DatasetException("No usable rows in " + filename_ + " (" + std::to_string(skippedRows_) + " skipped)");
    }

    // Integral labels keep their value; anything else becomes an enumerated class.
    bool integral = true;
    Labels numeric;
    numeric.reserve(rawLabels.size());
    for (const auto& raw : rawLabels) {
        double v = 0.0;
        if (!parseDouble(raw, v) || std::floor(v) != v ||
            v < static_cast<double>(std::numeric_limits<int>::min()) ||
            v > static_cast<double>(std::numeric_limits<int>::max())) {
            integral = false;
            break;
        }
        numeric.push_back(static_cast<int>(v));
    }

    labelNames_.clear();
    if (integral) {
        labels_ = std::move(numeric);
    } else {
        std::unordered_map<std::string, int> ids;
        labels_.clear();
        labels_.reserve(rawLabels.size());
        for (const auto& raw : rawLabels) {
            auto it = ids.find(raw);
            if (it == ids.end()) {
                it = ids.emplace(raw, static_cast<int>(labelNames_.size())).first;
                labelNames_.push_back(raw);
            }
            labels_.push_back(it->second);
        }
    }
    features_ = std::move(rows);
}

std::string LabeledDataset::labelName(int classId) const {
    if (labelNames_.empty()) return std::to_string(classId);
    if (classId < 0 || static_cast<size_t>(classId) >= labelNames_.size()) {
        throw Imbalance::DatasetException("Unknown class id " + std::to_string(classId));
    }
    return labelNames_[static_cast<size_t>(classId)];
}

ClassCounts LabeledDataset::classCounts() const {
    ClassCounts counts;
    for (int label : labels_) ++counts[label];
    return counts;
}

void LabeledDataset::save(const std::string& path, const FeatureMatrix& X, const Labels& y) const {
    if (X.size() != y.size()) {
        throw Imbalance::DatasetException("Cannot save " + std::to_string(X.size()) + " rows with " +
                                          std::to_string(y.size()) + " labels");
    }
    std::ofstream out(path);
    if (!out) {
        throw Imbalance::IOException("Could not open output file: " + path);
    }

    std::vector<std::string> header = featureNames_;
    header.push_back(targetName_);
    CSVUtils::writeRow(out, header, delimiter_);

    std::vector<std::string> fields;
    for (size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != featureNames_.size()) {
            throw Imbalance::DatasetException("Row " + std::to_string(i) + " has " + std::to_string(X[i].size()) +
                                              " features, expected " + std::to_string(featureNames_.size()));
        }
        fields.clear();
        for (double v : X[i]) {
            std::ostringstream cell;
            cell << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            fields.push_back(cell.str());
        }
        fields.push_back(labelName(y[i]));
        CSVUtils::writeRow(out, fields, delimiter_);
    }

    if (!out) {
        throw Imbalance::IOException("Failed while writing " + path);
    }
}
