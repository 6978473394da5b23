#include "ResamplePipeline.h"

#include "EditedNearestNeighbours.h"
#include "ImbalanceExceptions.h"
#include "LabeledDataset.h"
#include "ResampleReport.h"
#include "Smote.h"
#include "SmoteEnn.h"

#include <iostream>

std::unique_ptr<Sampler> ResamplePipeline::createSampler(const ResampleConfig& config) {
    const SamplerParams params = config.samplerParams();
    if (config.sampler == "smote") {
        return std::make_unique<Smote>(params, config.smoteOptions());
    }
    if (config.sampler == "enn") {
        return std::make_unique<EditedNearestNeighbours>(params, config.ennOptions());
    }
    if (config.sampler == "smote_enn") {
        return std::make_unique<SmoteEnn>(params, config.smoteEnnOptions());
    }
    throw Imbalance::ConfigurationException("Unknown sampler: " + config.sampler);
}

int ResamplePipeline::run(const ResampleConfig& config) {
    std::unique_ptr<Sampler> sampler = createSampler(config);

    LabeledDataset data(config.datasetPath, config.delimiter);
    data.load(config.targetColumn);
    if (data.skippedRows() > 0) {
        std::cerr << "[Imbalance] Warning: skipped " << data.skippedRows()
                  << " rows with missing, non-numeric or malformed fields.\n";
    }
    ResampleReport::printDatasetSummary(config.datasetPath, data.rowCount(), data.featureCount(), data.skippedRows());

    if (config.verbose) {
        std::cout << "[Imbalance] Resampling with " << sampler->name() << " (ratio=" << sampler->ratio().toString()
                  << ", label column '" << data.targetName() << "')...\n";
    }
    const Resampled result = sampler->fitTransform(data.features(), data.labels());

    ClassCounts after;
    for (int label : result.second) ++after[label];
    ResampleReport::printClassComparison(data.classCounts(), after, [&data](int c) { return data.labelName(c); });

    const std::string outputPath = config.resolvedOutputPath();
    data.save(outputPath, result.first, result.second);
    ResampleReport::printCompletion(sampler->name(), outputPath, data.rowCount(), result.first.size());
    return 0;
}
