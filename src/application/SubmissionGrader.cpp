/**
 * @file SubmissionGrader.cpp
 * @brief Implementation of SubmissionGrader.
 */

#include "application/SubmissionGrader.hpp"
#include <cmath>
#include <iostream>

namespace codegrader::application {

SubmissionGrader::SubmissionGrader(std::shared_ptr<StaticAnalyzer> analyzer,
                                   std::shared_ptr<domain::RubricProvider> rubrics,
                                   std::shared_ptr<ReviewAdapter> reviews,
                                   int passScoreThreshold)
    : m_analyzer(std::move(analyzer)),
      m_rubrics(std::move(rubrics)),
      m_reviews(std::move(reviews)),
      m_passScoreThreshold(passScoreThreshold) {}

std::string SubmissionGrader::FormatRuntime(double milliseconds) {
    return std::to_string(std::llround(milliseconds)) + "ms";
}

domain::GradedResult SubmissionGrader::grade(const domain::SourceUnit& unit,
                                             const std::optional<std::string>& topic) const {
    domain::AnalysisResult analysis = m_analyzer->analyze(unit);
    if (!analysis.valid) {
        std::cerr << "[SubmissionGrader] Analysis failed for " << unit.name << ": "
                  << (analysis.notes.empty() ? "" : analysis.notes.front()) << std::endl;
        return FromInvalid(analysis);
    }

    auto rubric = lookupRubric(topic.value_or(unit.name));
    ReviewOutcome review = m_reviews->review(unit.text, analysis, rubric);
    return Merge(analysis, review, m_passScoreThreshold);
}

std::optional<domain::RubricData> SubmissionGrader::lookupRubric(const std::string& key) const {
    if (!m_rubrics) return std::nullopt;
    try {
        return m_rubrics->fetch(key);
    } catch (const std::exception& e) {
        std::cerr << "[SubmissionGrader] Rubric lookup failed for '" << key << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

domain::GradedResult SubmissionGrader::FromInvalid(const domain::AnalysisResult& analysis) {
    domain::GradedResult result;
    result.name = analysis.name;
    result.valid = false;
    result.totalScore = 0;
    result.status = analysis.status;
    result.algorithms = "Analysis failed";
    result.runtime = "0ms";
    result.notes = analysis.notes;
    return result;
}

domain::GradedResult SubmissionGrader::Merge(const domain::AnalysisResult& analysis,
                                             const ReviewOutcome& review,
                                             int passScoreThreshold) {
    domain::GradedResult result;
    result.name = analysis.name;
    result.valid = true;
    result.totalScore = review.totalScore;
    result.breakdown = review.breakdown;
    result.hasRubric = review.hasRubric;

    if (review.totalScore && review.hasRubric) {
        result.status = *review.totalScore >= passScoreThreshold ? domain::GradeStatus::Pass
                                                                 : domain::GradeStatus::Fail;
    } else {
        result.status = domain::GradeStatus::Pending;
    }
    if (analysis.status == domain::GradeStatus::Flag) {
        result.status = domain::GradeStatus::Flag;
    }

    if (!review.algorithms.empty()) {
        result.algorithms = review.algorithms;
    } else {
        for (const auto& label : analysis.algorithms) {
            if (!result.algorithms.empty()) result.algorithms += ", ";
            result.algorithms += label;
        }
        if (result.algorithms.empty()) result.algorithms = "Basic Logic";
    }

    result.complexity = analysis.complexity;
    result.maxLoopDepth = analysis.maxLoopDepth;
    result.runtime = FormatRuntime(analysis.runtimeMs);
    result.strengths = review.strengths;
    result.weaknesses = review.weaknesses;
    result.reasoning = review.reasoning;
    result.improvement = review.improvement;
    result.complexityAnalysis = review.complexityAnalysis;

    result.notes = analysis.notes;
    result.notes.insert(result.notes.end(), review.notes.begin(), review.notes.end());

    result.aiScored = review.aiScored;
    result.fingerprint = analysis.fingerprint;
    return result;
}

} // namespace codegrader::application
