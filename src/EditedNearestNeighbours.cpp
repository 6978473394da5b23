#include "EditedNearestNeighbours.h"
#include "CommonUtils.h"
#include "ImbalanceExceptions.h"
#include "NearestNeighbors.h"
#include <iostream>
#include <map>

EnnSelection parseEnnSelection(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "all") return EnnSelection::ALL;
    if (v == "mode") return EnnSelection::MODE;
    throw Imbalance::ConfigurationException("kind_enn must be one of: all, mode (got '" + name + "')");
}

std::string toString(EnnSelection kind) {
    return kind == EnnSelection::MODE ? "mode" : "all";
}

EditedNearestNeighbours::EditedNearestNeighbours(SamplerParams params, EnnOptions options)
    : Sampler(std::move(params)), options_(options) {
    if (options_.sizeNgh < 1) throw Imbalance::ConfigurationException("size_ngh must be >= 1");
    if (options_.nJobs == 0 || options_.nJobs < -1) {
        throw Imbalance::ConfigurationException("n_jobs must be -1 or a positive thread count");
    }
}

Resampled EditedNearestNeighbours::transform(const FeatureMatrix& X, const Labels& y) {
    checkTransformInput(X);

    NearestNeighbors search(options_.sizeNgh, options_.nJobs);
    search.fit(X);

    Resampled out;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] != minorityClass()) continue;
        out.first.push_back(X[i]);
        out.second.push_back(y[i]);
    }

    for (const auto& kv : classStats()) {
        const int label = kv.first;
        if (label == minorityClass()) continue;

        std::vector<size_t> rows;
        rows.reserve(kv.second);
        for (size_t i = 0; i < y.size(); ++i) {
            if (y[i] == label) rows.push_back(i);
        }

        const NeighborResult nn = search.kneighborsOfMembers(rows, options_.sizeNgh);
        size_t kept = 0;
        for (size_t q = 0; q < rows.size(); ++q) {
            bool keep = false;
            if (options_.kindSel == EnnSelection::ALL) {
                keep = true;
                for (size_t idx : nn.indices[q]) {
                    if (y[idx] != label) {
                        keep = false;
                        break;
                    }
                }
            } else {
                // Most frequent label; ties go to the smallest class id.
                std::map<int, size_t> votes;
                for (size_t idx : nn.indices[q]) ++votes[y[idx]];
                int mode = votes.begin()->first;
                size_t best = 0;
                for (const auto& v : votes) {
                    if (v.second > best) {
                        best = v.second;
                        mode = v.first;
                    }
                }
                keep = (mode == label);
            }

            if (keep) {
                out.first.push_back(X[rows[q]]);
                out.second.push_back(label);
                ++kept;
            }
        }

        if (verbose()) {
            std::cout << logTag() << "Class " << label << ": kept " << kept << " of " << rows.size()
                      << " samples (kind_sel=" << toString(options_.kindSel) << ", size_ngh=" << options_.sizeNgh << ").\n";
        }
    }

    if (verbose()) {
        std::cout << logTag() << "Under-sampling performed: " << (X.size() - out.first.size())
                  << " samples removed, " << out.first.size() << " rows kept.\n";
    }
    return out;
}
