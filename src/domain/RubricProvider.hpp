/**
 * @file RubricProvider.hpp
 * @brief Problem/rubric metadata lookup.
 */

#pragma once
#include <optional>
#include <string>

namespace codegrader::domain {

/**
 * @struct RubricData
 * @brief Grading criteria of one problem from the question bank.
 */
struct RubricData {
    std::string problemId;
    std::string title;
    std::optional<std::string> rubric;
    std::optional<std::string> requirements;

    /** @brief True when numeric grading is allowed for this problem. */
    bool hasCriteria() const {
        return (rubric && !rubric->empty()) || (requirements && !requirements->empty());
    }
};

/**
 * @class RubricProvider
 * @brief Best-effort lookup. Network failures yield std::nullopt.
 */
class RubricProvider {
public:
    virtual ~RubricProvider() = default;

    /**
     * @brief Fetches the rubric for a topic or filename.
     * @param topicOrName Problem key or submitted filename.
     */
    virtual std::optional<RubricData> fetch(const std::string& topicOrName) = 0;
};

} // namespace codegrader::domain
