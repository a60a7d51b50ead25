/**
 * @file AlgorithmClassifier.hpp
 * @brief Maps extracted features to human-readable algorithm labels.
 */

#pragma once
#include <set>
#include <string>
#include "domain/FeatureRecord.hpp"

namespace codegrader::application {

/**
 * @class AlgorithmClassifier
 * @brief Combines structural pattern tags with a name keyword table.
 */
class AlgorithmClassifier {
public:
    /** @return Deduplicated, lexicographically ordered labels. */
    std::set<std::string> classify(const domain::FeatureRecord& features) const;
};

} // namespace codegrader::application
