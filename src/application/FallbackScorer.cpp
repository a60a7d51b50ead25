/**
 * @file FallbackScorer.cpp
 * @brief Implementation of FallbackScorer.
 */

#include "application/FallbackScorer.hpp"
#include <algorithm>

namespace codegrader::application {

domain::ScoreBreakdown FallbackScorer::score(const domain::FeatureRecord& features,
                                             const std::set<std::string>& algorithms) const {
    using domain::ScoreBreakdown;
    ScoreBreakdown result;

    int logic = 15; // parses and passed the safety scan
    if (features.functionCount > 0) logic += 8;
    if (features.classDefined) logic += 5;
    if (features.recursion) logic += 6;
    if (features.loops > 0) logic += 4;
    if (features.conditionals > 0) logic += 2;
    result.logic = std::min(logic, ScoreBreakdown::kMaxLogic);

    int algorithm = 10;
    algorithm += std::min(static_cast<int>(algorithms.size()) * 8, 20);
    algorithm += std::min(features.complexity() - 1, 10);
    result.algorithm = std::min(algorithm, ScoreBreakdown::kMaxAlgorithm);

    int style = 6;
    if (features.functionCount >= 2) style += 2;
    if (features.dataStructures.any()) style += 2;
    result.style = std::min(style, ScoreBreakdown::kMaxStyle);

    int optimization = 5;
    if (!features.nestedLoops) optimization += 2;
    if (features.dataStructures.set || features.dataStructures.mapping) optimization += 2;
    if (features.hints.memo) optimization += 1;
    result.optimization = std::min(optimization, ScoreBreakdown::kMaxOptimization);

    result.total = result.sum();
    return result;
}

} // namespace codegrader::application
