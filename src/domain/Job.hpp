/**
 * @file Job.hpp
 * @brief Lifecycle record of one grading request.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "domain/AnalysisResult.hpp"

namespace codegrader::domain {

enum class JobStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

inline const char* JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
    }
    return "pending";
}

/**
 * @struct JobSummary
 * @brief Aggregate numbers reported once a job completes.
 */
struct JobSummary {
    size_t fileCount = 0;
    std::optional<double> avgScore; ///< Mean of present total scores, one decimal.
    double elapsedSeconds = 0.0;
    size_t persistedCount = 0;
};

/**
 * @struct Job
 * @brief pending -> processing -> {completed | failed}.
 */
struct Job {
    std::string id;
    JobStatus status = JobStatus::Pending;
    std::string studentName;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::vector<GradedResult>> results;
    std::optional<JobSummary> summary;
    std::optional<std::string> error;
};

} // namespace codegrader::domain
