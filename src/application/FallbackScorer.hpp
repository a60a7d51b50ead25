/**
 * @file FallbackScorer.hpp
 * @brief Deterministic score used when the external reviewer cannot grade.
 */

#pragma once
#include <set>
#include <string>
#include "domain/AnalysisResult.hpp"
#include "domain/FeatureRecord.hpp"

namespace codegrader::application {

/**
 * @class FallbackScorer
 * @brief Four capped sub-scores derived from structural features.
 *
 * logic (0..40), algorithm (0..40), style (0..10), optimization (0..10).
 * The total is always the sum of the four parts.
 */
class FallbackScorer {
public:
    domain::ScoreBreakdown score(const domain::FeatureRecord& features,
                                 const std::set<std::string>& algorithms) const;
};

} // namespace codegrader::application
