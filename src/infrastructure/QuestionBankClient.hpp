/**
 * @file QuestionBankClient.hpp
 * @brief RubricProvider backed by the question bank REST API.
 */

#pragma once
#include <string>
#include "domain/RubricProvider.hpp"

namespace codegrader::infrastructure {

/**
 * @class QuestionBankClient
 * @brief GET {baseUrl}/problems/{id} with an x-api-key header.
 *
 * Any transport failure, non-200 status or malformed body yields std::nullopt.
 */
class QuestionBankClient : public domain::RubricProvider {
public:
    QuestionBankClient(std::string baseUrl, std::string apiKey, int timeoutSeconds = 10);

    std::optional<domain::RubricData> fetch(const std::string& topicOrName) override;

    /** @brief Drops every ".py" and surrounding whitespace: " two_sum.py" -> "two_sum". */
    static std::string NormalizeProblemId(const std::string& topicOrName);

    /** @brief Reads a 200 response body. */
    static std::optional<domain::RubricData> ParseProblem(const std::string& problemId, const std::string& body);

private:
    std::string m_baseUrl;
    std::string m_apiKey;
    int m_timeoutSeconds;
};

} // namespace codegrader::infrastructure
