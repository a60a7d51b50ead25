/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace codegrader::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 120);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        bool forceJson = false);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief Reads the "response" field of a /api/generate body. */
    static std::optional<std::string> ExtractResponse(const std::string& body);

    /** @brief Reads model names out of a /api/tags body. */
    static std::vector<std::string> ExtractModelNames(const std::string& body);

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace codegrader::infrastructure
