/**
 * @file ReviewAdapter.hpp
 * @brief Bridges static analysis and the external code reviewer.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/AnalysisResult.hpp"
#include "domain/CodeReviewer.hpp"
#include "domain/RubricProvider.hpp"

namespace codegrader::application {

/**
 * @struct ReviewOutcome
 * @brief Normalized qualitative review, whether it came from the reviewer or the fallback.
 */
struct ReviewOutcome {
    bool hasRubric = false;
    std::optional<int> totalScore;
    std::optional<domain::ScoreBreakdown> breakdown;
    std::string algorithms; ///< Reviewer's label; empty when the reviewer gave none.
    std::string strengths;
    std::string weaknesses;
    std::string reasoning;
    std::string improvement;
    std::string complexityAnalysis;
    std::vector<std::string> notes;
    bool aiScored = false;
};

/**
 * @class ReviewAdapter
 * @brief Builds the review prompt, calls the reviewer once and normalizes its answer.
 *
 * Any failure (exception, empty answer, malformed JSON) degrades to the
 * structural fallback. review() never throws.
 */
class ReviewAdapter {
public:
    /** @param reviewer May be null, in which case every review uses the fallback. */
    explicit ReviewAdapter(std::shared_ptr<domain::CodeReviewer> reviewer);

    ReviewOutcome review(const std::string& code,
                         const domain::AnalysisResult& analysis,
                         const std::optional<domain::RubricData>& rubric) const;

    /**
     * @brief Parses raw reviewer text (optionally wrapped in a Markdown fence).
     * @return std::nullopt when the text is not a JSON object.
     */
    static std::optional<ReviewOutcome> ParseResponse(const std::string& raw);

    static ReviewOutcome Fallback(const domain::AnalysisResult& analysis, bool hasCriteria);

    /** @brief Integer conversion clamped to [lo, hi]; non-numeric values yield lo. */
    static int Clamp(const nlohmann::json& value, int lo, int hi);

    static std::string StripCodeFence(const std::string& raw);

private:
    std::shared_ptr<domain::CodeReviewer> m_reviewer;
};

} // namespace codegrader::application
