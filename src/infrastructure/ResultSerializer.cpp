#include "infrastructure/ResultSerializer.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace codegrader::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

std::string ResultSerializer::FormatTimestamp(std::chrono::system_clock::time_point time) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(time));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

json ResultSerializer::ToJson(const domain::ScoreBreakdown& breakdown) {
    return {
        {"logic_score", breakdown.logic},
        {"algorithm_score", breakdown.algorithm},
        {"style_score", breakdown.style},
        {"optimization_score", breakdown.optimization}
    };
}

json ResultSerializer::ToJson(const domain::GradedResult& result) {
    json j = {
        {"filename", result.name},
        {"valid_score", result.valid},
        {"has_rubric", result.hasRubric},
        {"status", domain::StatusToString(result.status)},
        {"algorithms", result.algorithms},
        {"complexity", result.complexity},
        {"max_loop_depth", result.maxLoopDepth},
        {"runtime", result.runtime},
        {"strengths", result.strengths},
        {"weaknesses", result.weaknesses},
        {"reasoning", result.reasoning},
        {"improvement", result.improvement},
        {"complexity_analysis", result.complexityAnalysis},
        {"notes", result.notes},
        {"ai_scored", result.aiScored}
    };
    j["total_score"] = result.totalScore ? json(*result.totalScore) : json(nullptr);
    j["breakdown"] = result.breakdown ? ToJson(*result.breakdown) : json(nullptr);
    return j;
}

json ResultSerializer::ToJson(const domain::JobSummary& summary) {
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(1) << summary.elapsedSeconds << "s";

    json j = {
        {"total_files", summary.fileCount},
        {"total_time", elapsed.str()},
        {"saved_to_db", summary.persistedCount}
    };
    j["avg_score"] = summary.avgScore ? json(*summary.avgScore) : json(nullptr);
    return j;
}

json ResultSerializer::ToJson(const domain::Job& job) {
    json j = {
        {"job_id", job.id},
        {"status", domain::JobStatusToString(job.status)},
        {"student_name", job.studentName},
        {"created_at", FormatTimestamp(job.createdAt)}
    };
    if (job.results) {
        json results = json::array();
        for (const auto& result : *job.results) results.push_back(ToJson(result));
        j["results"] = results;
    }
    if (job.summary) j["summary"] = ToJson(*job.summary);
    if (job.error) j["error"] = *job.error;
    return j;
}

} // namespace codegrader::infrastructure
