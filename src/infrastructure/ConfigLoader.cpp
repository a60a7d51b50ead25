/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace codegrader::infrastructure {

namespace {

template<typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void OverrideFromEnv(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) target = value;
}

} // namespace

GraderConfig ConfigLoader::Load(const std::string& projectRoot) {
    GraderConfig config;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";

    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            ReadKey(j, "plagiarism_threshold", config.plagiarismThreshold);
            ReadKey(j, "pass_score_threshold", config.passScoreThreshold);
            ReadKey(j, "max_concurrent_reviews", config.maxConcurrentReviews);
            ReadKey(j, "job_ttl_seconds", config.jobTtlSeconds);
            ReadKey(j, "reap_interval_seconds", config.reapIntervalSeconds);
            ReadKey(j, "background_workers", config.backgroundWorkers);
            ReadKey(j, "ollama_host", config.ollamaHost);
            ReadKey(j, "ollama_port", config.ollamaPort);
            ReadKey(j, "ai_model", config.aiModel);
            ReadKey(j, "reviewer_timeout_seconds", config.reviewerTimeoutSeconds);
            ReadKey(j, "question_bank_url", config.questionBankUrl);
            ReadKey(j, "api_key", config.apiKey);
            ReadKey(j, "rubric_timeout_seconds", config.rubricTimeoutSeconds);
            ReadKey(j, "webhook_timeout_seconds", config.webhookTimeoutSeconds);
            ReadKey(j, "webhook_max_attempts", config.webhookMaxAttempts);
            ReadKey(j, "webhook_backoff_ms", config.webhookBackoffMs);
            ReadKey(j, "data_dir", config.dataDir);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        }
    }

    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(GraderConfig& config) {
    OverrideFromEnv("CODEGRADER_AI_MODEL", config.aiModel);
    OverrideFromEnv("CODEGRADER_OLLAMA_HOST", config.ollamaHost);
    OverrideFromEnv("CODEGRADER_QUESTION_BANK_URL", config.questionBankUrl);
    OverrideFromEnv("CODEGRADER_API_KEY", config.apiKey);
}

void ConfigLoader::Save(const std::string& projectRoot, const GraderConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";

    nlohmann::json j = {
        {"plagiarism_threshold", config.plagiarismThreshold},
        {"pass_score_threshold", config.passScoreThreshold},
        {"max_concurrent_reviews", config.maxConcurrentReviews},
        {"job_ttl_seconds", config.jobTtlSeconds},
        {"reap_interval_seconds", config.reapIntervalSeconds},
        {"background_workers", config.backgroundWorkers},
        {"ollama_host", config.ollamaHost},
        {"ollama_port", config.ollamaPort},
        {"ai_model", config.aiModel},
        {"reviewer_timeout_seconds", config.reviewerTimeoutSeconds},
        {"question_bank_url", config.questionBankUrl},
        {"api_key", config.apiKey},
        {"rubric_timeout_seconds", config.rubricTimeoutSeconds},
        {"webhook_timeout_seconds", config.webhookTimeoutSeconds},
        {"webhook_max_attempts", config.webhookMaxAttempts},
        {"webhook_backoff_ms", config.webhookBackoffMs},
        {"data_dir", config.dataDir}
    };

    try {
        std::ofstream f(configPath);
        f << j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace codegrader::infrastructure
