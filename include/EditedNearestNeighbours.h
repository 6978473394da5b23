#pragma once
#include "Sampler.h"
#include <cstddef>
#include <string>

enum class EnnSelection { ALL, MODE };

/**
 * @brief Parses all|mode.
 * @throws Imbalance::ConfigurationException on unknown names.
 */
EnnSelection parseEnnSelection(const std::string& name);
std::string toString(EnnSelection kind);

struct EnnOptions {
    // Neighbourhood size used to judge each sample.
    size_t sizeNgh = 3;
    EnnSelection kindSel = EnnSelection::ALL;
    int nJobs = -1;
};

/**
 * @brief Edited Nearest Neighbours under-sampling.
 * @details Removes non-minority samples whose neighbourhood disagrees with their label:
 *          ALL keeps a sample only when every neighbour shares its class,
 *          MODE keeps it when the most frequent neighbour class is its own.
 */
class EditedNearestNeighbours : public Sampler {
public:
    EditedNearestNeighbours(SamplerParams params, EnnOptions options = EnnOptions{});

    Resampled transform(const FeatureMatrix& X, const Labels& y) override;

    std::string name() const override { return "ENN"; }

    const EnnOptions& options() const noexcept { return options_; }

private:
    EnnOptions options_;
};
