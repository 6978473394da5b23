#pragma once
#include "ResampleTypes.h"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Numeric feature matrix plus one class label column loaded from CSV.
 */
class LabeledDataset {
public:
    explicit LabeledDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Loads the CSV file; every column but the label column must be numeric.
     * @details Integral labels keep their value as class id. Any other label text is mapped to
     *          ids 0, 1, ... in order of first appearance. Rows with a missing or non-numeric
     *          feature, a missing label or the wrong field count are skipped and counted.
     * @param targetColumn label column name; empty selects the last column.
     * @throws Imbalance::IOException when the file cannot be read.
     * @throws Imbalance::DatasetException when the header, label column or rows are unusable.
     */
    void load(const std::string& targetColumn = "");

    /**
     * @brief Writes X and y as CSV with the loaded header (features then label).
     * @pre X rows have featureCount() values.
     * @throws Imbalance::IOException when the file cannot be written.
     * @throws Imbalance::DatasetException on shape mismatch.
     */
    void save(const std::string& path, const FeatureMatrix& X, const Labels& y) const;

    const FeatureMatrix& features() const noexcept { return features_; }
    const Labels& labels() const noexcept { return labels_; }
    const std::vector<std::string>& featureNames() const noexcept { return featureNames_; }
    const std::string& targetName() const noexcept { return targetName_; }

    size_t rowCount() const noexcept { return features_.size(); }
    size_t featureCount() const noexcept { return featureNames_.size(); }
    size_t skippedRows() const noexcept { return skippedRows_; }

    bool hasTextLabels() const noexcept { return !labelNames_.empty(); }
    // Original label text of a class id.
    std::string labelName(int classId) const;

    ClassCounts classCounts() const;

private:
    std::string filename_;
    char delimiter_;
    FeatureMatrix features_;
    Labels labels_;
    std::vector<std::string> featureNames_;
    std::string targetName_;
    size_t targetIndex_ = 0;
    size_t skippedRows_ = 0;
    std::vector<std::string> labelNames_;

    static bool parseDouble(const std::string& v, double& out);
};
