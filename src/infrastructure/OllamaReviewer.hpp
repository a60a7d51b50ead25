/**
 * @file OllamaReviewer.hpp
 * @brief CodeReviewer backed by a local Ollama server.
 */

#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "domain/CodeReviewer.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace codegrader::infrastructure {

/**
 * @class OllamaReviewer
 * @brief Sends review prompts to /api/generate in JSON mode.
 */
class OllamaReviewer : public domain::CodeReviewer {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param configuredModel Model used when no preferred model is installed.
     * @param timeoutSeconds Read timeout per review.
     */
    OllamaReviewer(const std::string& host, int port, std::string configuredModel, int timeoutSeconds);

    std::optional<std::string> requestReview(const std::string& prompt) override;
    std::string getCurrentModel() const override;

    /**
     * @brief Picks the first installed model matching the coder-first priority list.
     * @return The configured model when nothing matches.
     */
    static std::string SelectModel(const std::vector<std::string>& available, const std::string& configuredModel);

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model;
    mutable std::mutex m_modelMutex;
};

} // namespace codegrader::infrastructure
