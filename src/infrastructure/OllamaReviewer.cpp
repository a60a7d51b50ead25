/**
 * @file OllamaReviewer.cpp
 * @brief Implementation of OllamaReviewer.
 */

#include "infrastructure/OllamaReviewer.hpp"
#include <iostream>

namespace codegrader::infrastructure {

OllamaReviewer::OllamaReviewer(const std::string& host, int port, std::string configuredModel, int timeoutSeconds)
    : m_client(host, port, timeoutSeconds), m_model(std::move(configuredModel)) {
    detectBestModel();
}

std::string OllamaReviewer::SelectModel(const std::vector<std::string>& available,
                                        const std::string& configuredModel) {
    // Priority Hierarchy
    static const std::vector<std::string> priorities = {
        "qwen2.5-coder",
        "deepseek-coder",
        "codellama",
        "qwen2.5",
        "llama3"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : available) {
            if (model.find(priority) != std::string::npos) {
                return model;
            }
        }
    }
    return configuredModel;
}

void OllamaReviewer::detectBestModel() {
    std::vector<std::string> available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaReviewer] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    m_model = SelectModel(available, m_model);
    std::cout << "[OllamaReviewer] Auto-selected model: " << m_model << std::endl;
}

std::optional<std::string> OllamaReviewer::requestReview(const std::string& prompt) {
    return m_client.generate(getCurrentModel(), prompt, true);
}

std::string OllamaReviewer::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace codegrader::infrastructure
