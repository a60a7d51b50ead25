#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace codegrader::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kReviewTemperature = 0.1;
constexpr int kDeterministicSeed = 42;
constexpr int kTagsTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& prompt,
                                                  bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kReviewTemperature},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    const std::string body = requestData.dump(-1, ' ', false, json::error_handler_t::replace);
    auto res = cli.Post("/api/generate", body, "application/json");
    if (res && res->status == 200) {
        return ExtractResponse(res->body);
    }
    if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kTagsTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    if (res && res->status == 200) {
        return ExtractModelNames(res->body);
    }
    return {};
}

std::optional<std::string> OllamaClient::ExtractResponse(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("response") && parsed["response"].is_string()) {
            return parsed["response"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::ExtractModelNames(const std::string& body) {
    std::vector<std::string> models;
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("models") && parsed["models"].is_array()) {
            for (const auto& item : parsed["models"]) {
                if (item.contains("name") && item["name"].is_string()) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
    }
    return models;
}

} // namespace codegrader::infrastructure
