/**
 * @file GradingOrchestrator.hpp
 * @brief Background grading jobs: fan-out per unit, similarity, persistence, notification.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/ConcurrencyLimiter.hpp"
#include "application/JobStore.hpp"
#include "application/NotificationDispatcher.hpp"
#include "application/SimilarityDetector.hpp"
#include "application/SubmissionGrader.hpp"
#include "domain/ResultRepository.hpp"
#include "domain/SourceUnit.hpp"

namespace codegrader::application {

/**
 * @struct SubmissionRequest
 * @brief One batch of files from one student.
 */
struct SubmissionRequest {
    std::vector<domain::SourceUnit> units;
    std::optional<std::string> topic;
    std::string studentName = "Anonymous";
    std::optional<std::string> assignmentCode;
    std::optional<std::string> callbackUrl;
};

/**
 * @class GradingOrchestrator
 * @brief Owns the job lifecycle pending -> processing -> completed | failed.
 */
class GradingOrchestrator {
public:
    /**
     * @param grader Per-unit grading path.
     * @param jobs Shared job table.
     * @param limiter Process-wide cap on concurrent per-unit steps.
     * @param tasks Worker pool running jobs and notifications.
     * @param repository Durable store; may be null.
     * @param notifier Webhook dispatcher; may be null.
     * @param detector Similarity stage configuration.
     */
    GradingOrchestrator(std::shared_ptr<SubmissionGrader> grader,
                        JobStore& jobs,
                        std::shared_ptr<ConcurrencyLimiter> limiter,
                        std::shared_ptr<AsyncTaskManager> tasks,
                        std::shared_ptr<domain::ResultRepository> repository,
                        std::shared_ptr<NotificationDispatcher> notifier,
                        SimilarityDetector detector = SimilarityDetector());

    /**
     * @brief Registers a pending job, queues it and returns its id immediately.
     * Expired jobs are swept first.
     */
    std::string submit(SubmissionRequest request);

    /** @brief Executes a job synchronously on the calling thread. */
    void runJob(const std::string& jobId, const SubmissionRequest& request);

    std::optional<domain::Job> getJob(const std::string& jobId) const;

    /** @brief Blocks until every queued job and notification has finished. */
    void drain();

    static std::string DecorateName(const std::string& studentName, const std::string& name);

private:
    std::vector<domain::GradedResult> gradeAll(const SubmissionRequest& request);
    size_t persist(const std::vector<domain::GradedResult>& results,
                   const std::optional<std::string>& assignmentCode);
    void markFailed(const std::string& jobId, const std::string& error);
    void scheduleNotification(const std::string& jobId, const std::string& url);

    std::shared_ptr<SubmissionGrader> m_grader;
    JobStore& m_jobs;
    std::shared_ptr<ConcurrencyLimiter> m_limiter;
    std::shared_ptr<AsyncTaskManager> m_tasks;
    std::shared_ptr<domain::ResultRepository> m_repository;
    std::shared_ptr<NotificationDispatcher> m_notifier;
    SimilarityDetector m_detector;
};

} // namespace codegrader::application
