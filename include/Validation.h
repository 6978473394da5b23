#pragma once
#include "ResampleTypes.h"
#include <cstdint>

namespace Validation {

/**
 * @brief Checks that X and y describe one consistent supervised dataset.
 * @pre none.
 * @post X is non-empty, rectangular, finite, has at least one feature and y.size() == X.size().
 * @throws Imbalance::DatasetException naming the first violated condition.
 */
void checkXY(const FeatureMatrix& X, const Labels& y);

/**
 * @brief Order-sensitive 64-bit FNV-1a digest of the matrix content.
 * @details Used to tell whether transform() receives the data fit() saw.
 */
uint64_t fingerprint(const FeatureMatrix& X);

} // namespace Validation
