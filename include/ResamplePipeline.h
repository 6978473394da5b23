#pragma once

#include "ResampleConfig.h"
#include "Sampler.h"

#include <memory>

class ResamplePipeline final {
public:
    /**
     * @brief Instantiates the sampler named by config.sampler.
     * @throws Imbalance::ConfigurationException on invalid options.
     */
    static std::unique_ptr<Sampler> createSampler(const ResampleConfig& config);

    /**
     * @brief Loads the dataset, resamples it, prints the class balance and writes the result.
     * @return process exit code.
     * @throws Imbalance::ImbalanceException on IO, dataset or configuration failures.
     */
    int run(const ResampleConfig& config);
};
