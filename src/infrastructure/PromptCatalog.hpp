/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the code reviewer prompt.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/AnalysisResult.hpp"
#include "domain/RubricProvider.hpp"

namespace codegrader::infrastructure {

class PromptCatalog {
public:
    /** @brief Reviewer persona, deduction rules and score bands. */
    static std::string GetReviewerPersona();

    /** @brief Grading criteria block: rubric, requirements, or a commentary-only instruction. */
    static std::string GetRubricSection(const std::optional<domain::RubricData>& rubric);

    /** @brief One-line summary of the static analysis shown to the reviewer. */
    static std::string GetFeatureSummary(const domain::AnalysisResult& analysis);

    /** @brief JSON response contract the reviewer must follow. */
    static std::string GetResponseContract(bool hasCriteria);

    /**
     * @brief Assembles the complete review prompt.
     * @param code Submitted source.
     * @param analysis Static analysis of the same source.
     * @param rubric Problem criteria, if the question bank had any.
     */
    static std::string BuildReviewPrompt(const std::string& code,
                                         const domain::AnalysisResult& analysis,
                                         const std::optional<domain::RubricData>& rubric);
};

} // namespace codegrader::infrastructure
