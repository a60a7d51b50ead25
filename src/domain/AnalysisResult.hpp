/**
 * @file AnalysisResult.hpp
 * @brief Per-submission static analysis output and grading result shapes.
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace codegrader::domain {

/**
 * @enum GradeStatus
 * @brief Final verdict of one submission.
 */
enum class GradeStatus {
    Pending,
    Pass,
    Fail,
    Flag
};

inline const char* StatusToString(GradeStatus status) {
    switch (status) {
        case GradeStatus::Pending: return "PENDING";
        case GradeStatus::Pass: return "PASS";
        case GradeStatus::Fail: return "FAIL";
        case GradeStatus::Flag: return "FLAG";
    }
    return "PENDING";
}

/// Set of 3-shingles over node-type tokens.
using Fingerprint = std::set<std::string>;

/**
 * @struct ScoreBreakdown
 * @brief Four capped sub-scores plus a total.
 *
 * Fallback-sourced breakdowns always satisfy total == sum of sub-scores.
 * Reviewer-sourced ones carry the reviewer's own clamped total.
 */
struct ScoreBreakdown {
    int total = 0;
    int logic = 0;        ///< 0..40
    int algorithm = 0;    ///< 0..40
    int style = 0;        ///< 0..10
    int optimization = 0; ///< 0..10

    static constexpr int kMaxTotal = 100;
    static constexpr int kMaxLogic = 40;
    static constexpr int kMaxAlgorithm = 40;
    static constexpr int kMaxStyle = 10;
    static constexpr int kMaxOptimization = 10;

    int sum() const { return logic + algorithm + style + optimization; }
};

/**
 * @struct FeatureSummary
 * @brief Compact feature view handed to the external reviewer.
 */
struct FeatureSummary {
    int loops = 0;
    int conditionals = 0;
    int functions = 0;
    bool recursion = false;
    bool classDefined = false;
};

/**
 * @struct AnalysisResult
 * @brief Normalized static analysis of one source unit.
 */
struct AnalysisResult {
    std::string name;
    bool valid = false; ///< false on syntax error or safety violation
    std::set<std::string> algorithms;
    int complexity = 0;
    int maxLoopDepth = 0;
    std::optional<Fingerprint> fingerprint;
    std::optional<ScoreBreakdown> fallbackScore;
    FeatureSummary summary;
    std::vector<std::string> notes;
    GradeStatus status = GradeStatus::Pending;
    double runtimeMs = 0.0;
};

/**
 * @struct GradedResult
 * @brief Merge of static analysis and qualitative review. Persisted and returned.
 */
struct GradedResult {
    std::string name;
    bool valid = false;
    std::optional<int> totalScore;
    std::optional<ScoreBreakdown> breakdown;
    bool hasRubric = false;
    GradeStatus status = GradeStatus::Pending;
    std::string algorithms; ///< Display label, e.g. "Binary Search, Recursion".
    int complexity = 0;
    int maxLoopDepth = 0;
    std::string runtime;
    std::string strengths;
    std::string weaknesses;
    std::string reasoning;
    std::string improvement;
    std::string complexityAnalysis;
    std::vector<std::string> notes;
    bool aiScored = false;
    std::optional<Fingerprint> fingerprint; ///< Stripped by the similarity stage.
};

} // namespace codegrader::domain
