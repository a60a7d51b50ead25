/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving grader configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place. Environment variables
 * override the file for deployment-specific values.
 */

#pragma once

#include <string>

namespace codegrader::infrastructure {

/**
 * @struct GraderConfig
 * @brief Every tunable of the grading service, with its default.
 */
struct GraderConfig {
    double plagiarismThreshold = 0.85;
    int passScoreThreshold = 50;
    int maxConcurrentReviews = 50;
    int jobTtlSeconds = 3600;
    int reapIntervalSeconds = 3600;
    int backgroundWorkers = 4;

    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string aiModel = "qwen2.5-coder:7b";
    int reviewerTimeoutSeconds = 120;

    std::string questionBankUrl = "http://localhost:8000";
    std::string apiKey;
    int rubricTimeoutSeconds = 10;

    int webhookTimeoutSeconds = 10;
    int webhookMaxAttempts = 3;
    int webhookBackoffMs = 1000;

    std::string dataDir = "data/scores";
};

class ConfigLoader {
public:
    /**
     * @brief Reads <projectRoot>/settings.json, then applies CODEGRADER_* environment overrides.
     *
     * A missing or unreadable file yields the defaults. Missing keys keep their defaults.
     */
    static GraderConfig Load(const std::string& projectRoot);

    /** @brief Writes the full configuration to <projectRoot>/settings.json. */
    static void Save(const std::string& projectRoot, const GraderConfig& config);

    /** @brief Applies CODEGRADER_AI_MODEL, _OLLAMA_HOST, _QUESTION_BANK_URL and _API_KEY. */
    static void ApplyEnvironment(GraderConfig& config);
};

} // namespace codegrader::infrastructure
