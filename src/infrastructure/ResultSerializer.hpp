/**
 * @file ResultSerializer.hpp
 * @brief JSON views of grading results and jobs.
 */

#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/AnalysisResult.hpp"
#include "domain/Job.hpp"

namespace codegrader::infrastructure {

class ResultSerializer {
public:
    static nlohmann::json ToJson(const domain::ScoreBreakdown& breakdown);
    static nlohmann::json ToJson(const domain::GradedResult& result);
    static nlohmann::json ToJson(const domain::JobSummary& summary);
    static nlohmann::json ToJson(const domain::Job& job);

    /** @brief "2024-05-01T12:30:00Z" */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);
};

} // namespace codegrader::infrastructure
