#include "Smote.h"
#include "CommonUtils.h"
#include "ImbalanceExceptions.h"
#include "LinearSvm.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace {
struct MinorityView {
    std::vector<size_t> rows;  // indices into X
    FeatureMatrix data;
    std::unordered_map<size_t, size_t> localIndex;  // X row -> position in data
};

MinorityView collectClass(const FeatureMatrix& X, const Labels& y, int label) {
    MinorityView view;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] != label) continue;
        view.localIndex[i] = view.rows.size();
        view.rows.push_back(i);
        view.data.push_back(X[i]);
    }
    return view;
}

// Beta(a, b) via two gamma draws.
double sampleBeta(double a, double b, std::mt19937& rng) {
    std::gamma_distribution<double> ga(a, 1.0);
    std::gamma_distribution<double> gb(b, 1.0);
    const double x = ga(rng);
    const double z = gb(rng);
    return x / (x + z);
}

std::vector<size_t> selectRows(const std::vector<size_t>& rows, const std::vector<bool>& mask, bool keep) {
    std::vector<size_t> out;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (mask[i] == keep) out.push_back(rows[i]);
    }
    return out;
}

FeatureMatrix gatherRows(const FeatureMatrix& X, const std::vector<size_t>& rows) {
    FeatureMatrix out;
    out.reserve(rows.size());
    for (size_t r : rows) out.push_back(X[r]);
    return out;
}
}

SmoteKind parseSmoteKind(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "regular") return SmoteKind::REGULAR;
    if (v == "borderline1") return SmoteKind::BORDERLINE1;
    if (v == "borderline2") return SmoteKind::BORDERLINE2;
    if (v == "svm") return SmoteKind::SVM;
    throw Imbalance::ConfigurationException("kind_smote must be one of: regular, borderline1, borderline2, svm (got '" + name + "')");
}

std::string toString(SmoteKind kind) {
    switch (kind) {
        case SmoteKind::REGULAR: return "regular";
        case SmoteKind::BORDERLINE1: return "borderline1";
        case SmoteKind::BORDERLINE2: return "borderline2";
        case SmoteKind::SVM: return "svm";
    }
    return "regular";
}

Smote::Smote(SamplerParams params, SmoteOptions options)
    : Sampler(std::move(params)), options_(std::move(options)) {
    if (options_.k < 1) throw Imbalance::ConfigurationException("k must be >= 1");
    if (options_.m < 1) throw Imbalance::ConfigurationException("m must be >= 1");
    if (!(options_.outStep >= 0.0)) throw Imbalance::ConfigurationException("out_step must be >= 0");
    if (options_.nJobs == 0 || options_.nJobs < -1) {
        throw Imbalance::ConfigurationException("n_jobs must be -1 or a positive thread count");
    }
    const std::string method = CommonUtils::toLower(options_.nnMethod);
    if (method == "approximate") {
        throw Imbalance::ConfigurationException("nn_method 'approximate' is not available; use 'exact'");
    }
    if (method != "exact") {
        throw Imbalance::ConfigurationException("nn_method must be 'exact' (got '" + options_.nnMethod + "')");
    }
    options_.nnMethod = method;
    if (!(options_.svmC > 0.0)) throw Imbalance::ConfigurationException("svm_c must be > 0");
    if (options_.svmEpochs < 1) throw Imbalance::ConfigurationException("svm_epochs must be >= 1");
}

Smote& Smote::fit(const FeatureMatrix& X, const Labels& y) {
    Sampler::fit(X, y);

    const double majority = static_cast<double>(classStats().at(majorityClass()));
    const double minority = static_cast<double>(classStats().at(minorityClass()));
    const double wanted = ratio().isAuto() ? (majority - minority) : std::floor(ratio().value() * majority - minority);
    if (wanted < 0.0) {
        throw Imbalance::ConfigurationException(
            "ratio " + ratio().toString() + " is below the current minority/majority ratio; SMOTE cannot remove samples");
    }
    numSamples_ = static_cast<size_t>(wanted);
    return *this;
}

Resampled Smote::transform(const FeatureMatrix& X, const Labels& y) {
    checkTransformInput(X);
    std::mt19937 rng = makeEngine();

    FeatureMatrix synthetic;
    if (numSamples_ == 0) {
        if (verbose()) std::cout << logTag() << "Classes already balanced for ratio " << ratio().toString() << ", nothing to generate.\n";
    } else {
        if (verbose()) {
            std::cout << logTag() << "Generating " << numSamples_ << " samples with kind '" << toString(options_.kind)
                      << "' (k=" << options_.k << ", m=" << options_.m << ")...\n";
        }
        switch (options_.kind) {
            case SmoteKind::REGULAR: synthetic = generateRegular(X, y, rng); break;
            case SmoteKind::BORDERLINE1:
            case SmoteKind::BORDERLINE2: synthetic = generateBorderline(X, y, rng); break;
            case SmoteKind::SVM: synthetic = generateSvm(X, y, rng); break;
        }
    }

    Resampled out{X, y};
    out.first.reserve(X.size() + synthetic.size());
    out.second.reserve(y.size() + synthetic.size());
    for (auto& row : synthetic) {
        out.first.push_back(std::move(row));
        out.second.push_back(minorityClass());
    }

    if (verbose()) {
        std::cout << logTag() << "Over-sampling performed: " << (out.first.size() - X.size())
                  << " synthetic samples, " << out.first.size() << " rows total.\n";
    }
    return out;
}

FeatureMatrix Smote::makeSamples(const FeatureMatrix& seeds,
                                 const FeatureMatrix& pool,
                                 const std::vector<std::vector<size_t>>& neighbours,
                                 size_t count,
                                 double stepSize,
                                 std::mt19937& rng) const {
    FeatureMatrix out;
    if (count == 0 || seeds.empty()) return out;
    out.reserve(count);

    std::uniform_int_distribution<size_t> pickSeed(0, seeds.size() - 1);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (size_t i = 0; i < count; ++i) {
        const size_t row = pickSeed(rng);
        const auto& nn = neighbours[row];
        std::uniform_int_distribution<size_t> pickNeighbour(0, nn.size() - 1);
        const auto& partner = pool[nn[pickNeighbour(rng)]];
        const double step = stepSize * unit(rng);

        const auto& seed = seeds[row];
        std::vector<double> sample(seed.size());
        for (size_t j = 0; j < seed.size(); ++j) {
            sample[j] = seed[j] - step * (seed[j] - partner[j]);
        }
        out.push_back(std::move(sample));
    }
    return out;
}

std::vector<bool> Smote::inDangerNoise(const NearestNeighbors& searchX,
                                       const std::vector<size_t>& rows,
                                       const Labels& y,
                                       bool noise) const {
    const NeighborResult nn = searchX.kneighborsOfMembers(rows, options_.m);
    const double half = static_cast<double>(options_.m) / 2.0;

    std::vector<bool> flags(rows.size(), false);
    for (size_t i = 0; i < rows.size(); ++i) {
        size_t nMaj = 0;
        for (size_t idx : nn.indices[i]) {
            if (y[idx] != minorityClass()) ++nMaj;
        }
        if (noise) {
            flags[i] = (nMaj == options_.m);
        } else {
            flags[i] = (static_cast<double>(nMaj) >= half && nMaj < options_.m);
        }
    }
    return flags;
}

FeatureMatrix Smote::generateRegular(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const {
    const MinorityView minority = collectClass(X, y, minorityClass());

    NearestNeighbors search(options_.k, options_.nJobs);
    search.fit(minority.data);
    std::vector<size_t> all(minority.data.size());
    for (size_t i = 0; i < all.size(); ++i) all[i] = i;
    const NeighborResult nn = search.kneighborsOfMembers(all, options_.k);

    return makeSamples(minority.data, minority.data, nn.indices, numSamples_, 1.0, rng);
}

FeatureMatrix Smote::generateBorderline(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const {
    const MinorityView minority = collectClass(X, y, minorityClass());

    NearestNeighbors searchX(options_.m, options_.nJobs);
    searchX.fit(X);
    const std::vector<bool> danger = inDangerNoise(searchX, minority.rows, y, false);
    const std::vector<size_t> dangerRows = selectRows(minority.rows, danger, true);

    if (dangerRows.empty()) {
        if (verbose()) std::cout << logTag() << "There are no samples in danger. No borderline synthetic samples created.\n";
        return {};
    }
    if (verbose()) std::cout << logTag() << dangerRows.size() << " minority samples in danger.\n";

    const FeatureMatrix seeds = gatherRows(X, dangerRows);
    std::vector<size_t> dangerLocal;
    dangerLocal.reserve(dangerRows.size());
    for (size_t r : dangerRows) dangerLocal.push_back(minority.localIndex.at(r));

    NearestNeighbors searchMin(options_.k, options_.nJobs);
    searchMin.fit(minority.data);
    const NeighborResult nnMin = searchMin.kneighborsOfMembers(dangerLocal, options_.k);

    if (options_.kind == SmoteKind::BORDERLINE1) {
        return makeSamples(seeds, minority.data, nnMin.indices, numSamples_, 1.0, rng);
    }

    const double fraction = sampleBeta(10.0, 10.0, rng);
    const size_t fromMinority = static_cast<size_t>(std::floor(fraction * static_cast<double>(numSamples_ + 1)));
    const size_t fromOthers = static_cast<size_t>(std::floor((1.0 - fraction) * static_cast<double>(numSamples_)));

    FeatureMatrix out = makeSamples(seeds, minority.data, nnMin.indices, fromMinority, 1.0, rng);

    FeatureMatrix others;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] != minorityClass()) others.push_back(X[i]);
    }
    NearestNeighbors searchOthers(options_.k, options_.nJobs);
    searchOthers.fit(others);
    const NeighborResult nnOthers = searchOthers.kneighbors(seeds, options_.k);

    FeatureMatrix second = makeSamples(seeds, others, nnOthers.indices, fromOthers, 0.5, rng);
    for (auto& row : second) out.push_back(std::move(row));
    return out;
}

FeatureMatrix Smote::generateSvm(const FeatureMatrix& X, const Labels& y, std::mt19937& rng) const {
    const MinorityView minority = collectClass(X, y, minorityClass());

    std::vector<int> signs(y.size());
    for (size_t i = 0; i < y.size(); ++i) signs[i] = (y[i] == minorityClass()) ? 1 : -1;

    LinearSvm svm(options_.svmC, options_.svmEpochs);
    svm.fit(X, signs, rng);

    std::vector<size_t> support;
    for (size_t idx : svm.supportIndices(X, signs)) {
        if (y[idx] == minorityClass()) support.push_back(idx);
    }

    NearestNeighbors searchX(options_.m, options_.nJobs);
    searchX.fit(X);

    if (!support.empty()) {
        const std::vector<bool> noise = inDangerNoise(searchX, support, y, true);
        support = selectRows(support, noise, false);
    }
    if (support.empty()) {
        if (verbose()) std::cout << logTag() << "No usable minority support vectors. No synthetic samples created.\n";
        return {};
    }

    const std::vector<bool> danger = inDangerNoise(searchX, support, y, false);
    const std::vector<size_t> dangerRows = selectRows(support, danger, true);
    const std::vector<size_t> safeRows = selectRows(support, danger, false);
    if (verbose()) {
        std::cout << logTag() << support.size() << " minority support vectors (" << dangerRows.size()
                  << " in danger, " << safeRows.size() << " safe).\n";
    }

    const double fraction = sampleBeta(10.0, 10.0, rng);
    size_t fromDanger = static_cast<size_t>(std::floor(fraction * static_cast<double>(numSamples_ + 1)));
    size_t fromSafe = static_cast<size_t>(std::floor((1.0 - fraction) * static_cast<double>(numSamples_)));
    // A single populated group carries the whole budget.
    if (safeRows.empty()) fromDanger = numSamples_;
    if (dangerRows.empty()) fromSafe = numSamples_;

    NearestNeighbors searchMin(options_.k, options_.nJobs);
    searchMin.fit(minority.data);

    auto neighboursOf = [&](const std::vector<size_t>& rows) {
        std::vector<size_t> local;
        local.reserve(rows.size());
        for (size_t r : rows) local.push_back(minority.localIndex.at(r));
        return searchMin.kneighborsOfMembers(local, options_.k).indices;
    };

    FeatureMatrix out;
    if (!dangerRows.empty()) {
        out = makeSamples(gatherRows(X, dangerRows), minority.data, neighboursOf(dangerRows), fromDanger, 1.0, rng);
    }
    if (!safeRows.empty()) {
        FeatureMatrix extrapolated = makeSamples(gatherRows(X, safeRows), minority.data, neighboursOf(safeRows),
                                                 fromSafe, -options_.outStep, rng);
        for (auto& row : extrapolated) out.push_back(std::move(row));
    }
    return out;
}
