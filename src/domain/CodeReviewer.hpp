/**
 * @file CodeReviewer.hpp
 * @brief Interface for the external qualitative reviewer.
 */

#pragma once
#include <optional>
#include <string>

namespace codegrader::domain {

/**
 * @class CodeReviewer
 * @brief Abstract gateway to a language model that reviews student code.
 *
 * Implementations send a fully formatted prompt and return the raw model text.
 * Returning std::nullopt or throwing both mean "reviewer unavailable".
 */
class CodeReviewer {
public:
    virtual ~CodeReviewer() = default;

    /**
     * @brief Requests a JSON review for the given prompt.
     * @param prompt Complete prompt (persona, rubric, features, code, response contract).
     * @return Raw response text if the call succeeded.
     */
    virtual std::optional<std::string> requestReview(const std::string& prompt) = 0;

    /** @brief Name of the model currently in use. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace codegrader::domain
