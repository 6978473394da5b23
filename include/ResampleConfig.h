#pragma once
#include "EditedNearestNeighbours.h"
#include "Sampler.h"
#include "Smote.h"
#include "SmoteEnn.h"
#include <cstdint>
#include <optional>
#include <string>

struct ResampleConfig {
    std::string datasetPath;
    // Empty => <dataset stem>_resampled.csv next to the input.
    std::string outputPath;
    std::string targetColumn;
    char delimiter = ',';

    std::string sampler = "smote_enn";  // smote_enn|smote|enn
    std::string ratio = "auto";         // auto|(0,1]
    std::optional<uint32_t> randomState;
    bool verbose = true;

    // SMOTE stage
    int k = 5;
    int m = 10;
    double outStep = 0.5;
    std::string kindSmote = "regular";  // regular|borderline1|borderline2|svm
    std::string nnMethod = "exact";
    double svmC = 1.0;
    int svmEpochs = 50;

    // ENN stage
    int sizeNgh = 3;
    std::string kindEnn = "all";  // all|mode

    int nJobs = -1;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argc/argv contain at least dataset path in argv[1].
     * @post Returns a validated config object.
     * @throws Imbalance::ConfigurationException on invalid arguments or values.
     */
    static ResampleConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Imbalance::ConfigurationException on parse/validation failures.
     */
    static ResampleConfig fromFile(const std::string& configPath, const ResampleConfig& base);

    /**
     * @brief Validates value ranges and enum-like fields.
     * @throws Imbalance::ConfigurationException on invalid values.
     */
    void validate() const;

    std::string resolvedOutputPath() const;

    SamplerParams samplerParams() const;
    SmoteOptions smoteOptions() const;
    EnnOptions ennOptions() const;
    SmoteEnnOptions smoteEnnOptions() const;

    static std::string usage();
};
