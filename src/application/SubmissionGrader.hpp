/**
 * @file SubmissionGrader.hpp
 * @brief Per-unit grading path: analysis, rubric lookup, review and merge.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "application/ReviewAdapter.hpp"
#include "application/StaticAnalyzer.hpp"
#include "domain/AnalysisResult.hpp"
#include "domain/RubricProvider.hpp"
#include "domain/SourceUnit.hpp"

namespace codegrader::application {

/**
 * @class SubmissionGrader
 * @brief Grades one source unit end to end. Thread-safe; never throws for bad input.
 */
class SubmissionGrader {
public:
    SubmissionGrader(std::shared_ptr<StaticAnalyzer> analyzer,
                     std::shared_ptr<domain::RubricProvider> rubrics,
                     std::shared_ptr<ReviewAdapter> reviews,
                     int passScoreThreshold);
    virtual ~SubmissionGrader() = default;

    /**
     * @brief Grades a unit.
     * @param unit Source to grade.
     * @param topic Problem key used for the rubric lookup; the filename is used when absent.
     */
    virtual domain::GradedResult grade(const domain::SourceUnit& unit,
                                       const std::optional<std::string>& topic) const;

    /** @brief Converts an invalid analysis directly into a final result (score 0). */
    static domain::GradedResult FromInvalid(const domain::AnalysisResult& analysis);

    /** @brief Combines a valid analysis with a review outcome. */
    static domain::GradedResult Merge(const domain::AnalysisResult& analysis,
                                      const ReviewOutcome& review,
                                      int passScoreThreshold);

    static std::string FormatRuntime(double milliseconds);

private:
    std::optional<domain::RubricData> lookupRubric(const std::string& key) const;

    std::shared_ptr<StaticAnalyzer> m_analyzer;
    std::shared_ptr<domain::RubricProvider> m_rubrics;
    std::shared_ptr<ReviewAdapter> m_reviews;
    int m_passScoreThreshold;
};

} // namespace codegrader::application
