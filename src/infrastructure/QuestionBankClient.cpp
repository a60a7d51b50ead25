/**
 * @file QuestionBankClient.cpp
 * @brief Implementation of QuestionBankClient.
 */

#include "infrastructure/QuestionBankClient.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace codegrader::infrastructure {

namespace {

std::optional<std::string> TextOrDump(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace

QuestionBankClient::QuestionBankClient(std::string baseUrl, std::string apiKey, int timeoutSeconds)
    : m_baseUrl(std::move(baseUrl)), m_apiKey(std::move(apiKey)), m_timeoutSeconds(timeoutSeconds) {
    while (!m_baseUrl.empty() && m_baseUrl.back() == '/') m_baseUrl.pop_back();
}

std::string QuestionBankClient::NormalizeProblemId(const std::string& topicOrName) {
    std::string id = topicOrName;
    for (size_t pos = id.find(".py"); pos != std::string::npos; pos = id.find(".py", pos)) {
        id.erase(pos, 3);
    }
    const char* whitespace = " \t\r\n";
    size_t first = id.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    return id.substr(first, id.find_last_not_of(whitespace) - first + 1);
}

std::optional<domain::RubricData> QuestionBankClient::ParseProblem(const std::string& problemId,
                                                                   const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) return std::nullopt;

        domain::RubricData data;
        data.problemId = problemId;
        data.title = TextOrDump(j, "title").value_or(problemId);
        data.rubric = TextOrDump(j, "rubric");
        data.requirements = TextOrDump(j, "requirements");
        return data;
    } catch (const json::exception& e) {
        std::cerr << "[QuestionBankClient] Invalid problem JSON for '" << problemId << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::RubricData> QuestionBankClient::fetch(const std::string& topicOrName) {
    const std::string problemId = NormalizeProblemId(topicOrName);
    if (problemId.empty()) return std::nullopt;

    HttpEndpoint endpoint;
    try {
        endpoint = HttpEndpoint::Parse(m_baseUrl);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[QuestionBankClient] " << e.what() << std::endl;
        return std::nullopt;
    }
    std::string path = endpoint.path == "/" ? "" : endpoint.path;
    path += "/problems/" + HttpEndpoint::EncodePathSegment(problemId);

    httplib::Client cli(endpoint.base);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers = {{"x-api-key", m_apiKey}};
    auto res = cli.Get(path, headers);
    if (!res) {
        std::cerr << "[QuestionBankClient] Failed to fetch problem '" << problemId
                  << "': connection error " << static_cast<int>(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cout << "[QuestionBankClient] Problem '" << problemId << "' not found (HTTP " << res->status << ")" << std::endl;
        return std::nullopt;
    }
    return ParseProblem(problemId, res->body);
}

} // namespace codegrader::infrastructure
