#include "ResampleConfig.h"
#include "CommonUtils.h"
#include "ImbalanceExceptions.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Imbalance::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Imbalance::ImbalanceException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Imbalance::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Imbalance::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!(parsed >= minValue)) {
        throw Imbalance::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Imbalance::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// "none"/"null" clears the seed.
std::optional<uint32_t> parseSeed(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "none" || v == "null" || v.empty()) return std::nullopt;
    unsigned long parsed = parseNumericStrict<unsigned long>(
        v,
        key,
        "Invalid seed for ",
        [](const std::string& s, size_t* pos) { return std::stoul(s, pos); });
    if (v.front() == '-' || parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Imbalance::ConfigurationException("Value for " + key + " must be within uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

int parseJobs(const std::string& value, const std::string& key) {
    const int parsed = parseIntStrict(value, key, -1);
    if (parsed == 0) {
        throw Imbalance::ConfigurationException("Value for " + key + " must be -1 or a positive thread count");
    }
    return parsed;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Drops JSON braces and a trailing comma so both "key: value" and "\"key\": \"value\"," parse.
std::string stripStructuralTokens(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(ResampleConfig& config, const std::string& key, const std::string& value) {
    struct IntRule {
        int ResampleConfig::*member;
        int minValue;
    };
    struct DoubleRule {
        double ResampleConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string ResampleConfig::*> rawStringFields = {
        {"dataset", &ResampleConfig::datasetPath},
        {"output", &ResampleConfig::outputPath},
        {"target", &ResampleConfig::targetColumn}
    };
    static const std::unordered_map<std::string, std::string ResampleConfig::*> lowerStringFields = {
        {"sampler", &ResampleConfig::sampler},
        {"ratio", &ResampleConfig::ratio},
        {"kind_smote", &ResampleConfig::kindSmote},
        {"nn_method", &ResampleConfig::nnMethod},
        {"kind_enn", &ResampleConfig::kindEnn},
        {"kind_sel", &ResampleConfig::kindEnn}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"k", {&ResampleConfig::k, 1}},
        {"m", {&ResampleConfig::m, 1}},
        {"size_ngh", {&ResampleConfig::sizeNgh, 1}},
        {"svm_epochs", {&ResampleConfig::svmEpochs, 1}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"out_step", {&ResampleConfig::outStep, 0.0}},
        {"svm_c", {&ResampleConfig::svmC, 0.0}}
    };

    if (key == "delimiter") {
        if (value.size() != 1) throw Imbalance::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "random_state" || key == "seed") {
        config.randomState = parseSeed(value, key);
        return;
    }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        return;
    }
    if (key == "n_jobs") {
        config.nJobs = parseJobs(value, key);
        return;
    }

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = intFields.find(key); it != intFields.end()) {
        config.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    throw Imbalance::ConfigurationException("Unknown configuration key: " + key);
}
}

std::string ResampleConfig::usage() {
    return "Usage: imbalance <dataset.csv> [--config path] [--output out.csv] [--target col] [--delimiter ,] "
           "[--sampler smote_enn|smote|enn] [--ratio auto|0..1] [--random-state N|none] [--verbose true|false] "
           "[--k N] [--m N] [--out-step >=0] [--kind-smote regular|borderline1|borderline2|svm] [--nn-method exact] "
           "[--svm-c >0] [--svm-epochs N] [--size-ngh N] [--kind-enn all|mode] [--n-jobs -1|N]";
}

ResampleConfig ResampleConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Imbalance::ConfigurationException(usage());
    }

    ResampleConfig config;
    config.datasetPath = argv[1];

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            throw Imbalance::ConfigurationException("Unexpected argument '" + arg + "'\n" + usage());
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
        } else {
            assignKeyValue(config, normalizeConfigKey(arg.substr(2)), value);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }

    config.validate();
    return config;
}

ResampleConfig ResampleConfig::fromFile(const std::string& configPath, const ResampleConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Imbalance::ConfigurationException("Could not open config file: " + configPath);

    ResampleConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokens(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Imbalance::ImbalanceException& ex) {
            throw Imbalance::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void ResampleConfig::validate() const {
    if (datasetPath.empty()) {
        throw Imbalance::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(sampler, {"smote_enn", "smote", "enn"})) {
        throw Imbalance::ConfigurationException("sampler must be one of: smote_enn, smote, enn");
    }
    if (!isIn(kindSmote, {"regular", "borderline1", "borderline2", "svm"})) {
        throw Imbalance::ConfigurationException("kind_smote must be one of: regular, borderline1, borderline2, svm");
    }
    if (!isIn(nnMethod, {"exact"})) {
        throw Imbalance::ConfigurationException("nn_method must be 'exact'");
    }
    if (!isIn(kindEnn, {"all", "mode"})) {
        throw Imbalance::ConfigurationException("kind_enn must be one of: all, mode");
    }

    Ratio::parse(ratio);

    if (k < 1 || m < 1 || sizeNgh < 1) {
        throw Imbalance::ConfigurationException("k, m and size_ngh must be >= 1");
    }
    if (outStep < 0.0) {
        throw Imbalance::ConfigurationException("out_step must be >= 0");
    }
    if (svmC <= 0.0) {
        throw Imbalance::ConfigurationException("svm_c must be > 0");
    }
    if (svmEpochs < 1) {
        throw Imbalance::ConfigurationException("svm_epochs must be >= 1");
    }
    if (nJobs == 0 || nJobs < -1) {
        throw Imbalance::ConfigurationException("n_jobs must be -1 or a positive thread count");
    }
}

std::string ResampleConfig::resolvedOutputPath() const {
    if (!outputPath.empty()) return outputPath;
    const std::filesystem::path input(datasetPath);
    std::filesystem::path out = input.parent_path() / (input.stem().string() + "_resampled.csv");
    return out.string();
}

SamplerParams ResampleConfig::samplerParams() const {
    SamplerParams params;
    params.ratio = Ratio::parse(ratio);
    params.randomState = randomState;
    params.verbose = verbose;
    return params;
}

SmoteOptions ResampleConfig::smoteOptions() const {
    SmoteOptions o;
    o.k = static_cast<size_t>(k);
    o.m = static_cast<size_t>(m);
    o.outStep = outStep;
    o.kind = parseSmoteKind(kindSmote);
    o.nnMethod = nnMethod;
    o.nJobs = nJobs;
    o.svmC = svmC;
    o.svmEpochs = svmEpochs;
    return o;
}

EnnOptions ResampleConfig::ennOptions() const {
    EnnOptions o;
    o.sizeNgh = static_cast<size_t>(sizeNgh);
    o.kindSel = parseEnnSelection(kindEnn);
    o.nJobs = nJobs;
    return o;
}

SmoteEnnOptions ResampleConfig::smoteEnnOptions() const {
    SmoteEnnOptions o;
    o.k = static_cast<size_t>(k);
    o.m = static_cast<size_t>(m);
    o.outStep = outStep;
    o.kindSmote = parseSmoteKind(kindSmote);
    o.nnMethod = nnMethod;
    o.sizeNgh = static_cast<size_t>(sizeNgh);
    o.kindEnn = parseEnnSelection(kindEnn);
    o.nJobs = nJobs;
    o.svmC = svmC;
    o.svmEpochs = svmEpochs;
    return o;
}
