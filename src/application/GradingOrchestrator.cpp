/**
 * @file GradingOrchestrator.cpp
 * @brief Implementation of GradingOrchestrator.
 */

#include "application/GradingOrchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace codegrader::application {

namespace {
    std::string ShortId(const std::string& id) {
        return id.substr(0, 8);
    }
}

GradingOrchestrator::GradingOrchestrator(std::shared_ptr<SubmissionGrader> grader,
                                         JobStore& jobs,
                                         std::shared_ptr<ConcurrencyLimiter> limiter,
                                         std::shared_ptr<AsyncTaskManager> tasks,
                                         std::shared_ptr<domain::ResultRepository> repository,
                                         std::shared_ptr<NotificationDispatcher> notifier,
                                         SimilarityDetector detector)
    : m_grader(std::move(grader)),
      m_jobs(jobs),
      m_limiter(std::move(limiter)),
      m_tasks(std::move(tasks)),
      m_repository(std::move(repository)),
      m_notifier(std::move(notifier)),
      m_detector(detector) {}

std::string GradingOrchestrator::DecorateName(const std::string& studentName, const std::string& name) {
    if (name.find(" | ") != std::string::npos) return name;
    return studentName + " | " + name;
}

std::string GradingOrchestrator::submit(SubmissionRequest request) {
    m_jobs.sweepExpired();
    domain::Job job = m_jobs.create(request.studentName);
    const std::string jobId = job.id;

    std::cout << "[GradingOrchestrator] Job " << ShortId(jobId) << " queued: "
              << request.units.size() << " file(s) from " << request.studentName << std::endl;

    m_tasks->SubmitTask(TaskType::Grading, "Grade job " + ShortId(jobId),
        [this, jobId, request = std::move(request)](std::shared_ptr<TaskStatus>) {
            runJob(jobId, request);
        });
    return jobId;
}

std::optional<domain::Job> GradingOrchestrator::getJob(const std::string& jobId) const {
    return m_jobs.find(jobId);
}

void GradingOrchestrator::drain() {
    m_tasks->WaitForIdle();
}

void GradingOrchestrator::markFailed(const std::string& jobId, const std::string& error) {
    std::cerr << "[GradingOrchestrator] Job " << ShortId(jobId) << " failed: " << error << std::endl;
    const bool recorded = m_jobs.update(jobId, [&error](domain::Job& job) {
        job.status = domain::JobStatus::Failed;
        job.error = error;
    });
    if (!recorded) {
        std::cerr << "[GradingOrchestrator] Job " << ShortId(jobId) << " expired; failure not recorded" << std::endl;
    }
}

std::vector<domain::GradedResult> GradingOrchestrator::gradeAll(const SubmissionRequest& request) {
    const size_t count = request.units.size();
    std::vector<std::optional<domain::GradedResult>> slots(count);
    std::vector<std::optional<std::string>> errors(count);
    std::atomic<size_t> next{0};

    // Each worker claims the next unit until none are left.
    auto drainUnits = [&]() {
        for (size_t i = next++; i < count; i = next++) {
            try {
                ConcurrencyLimiter::Permit permit(*m_limiter);
                slots[i] = m_grader->grade(request.units[i], request.topic);
            } catch (const std::exception& e) {
                errors[i] = e.what();
            } catch (...) {
                errors[i] = "Unknown error while grading " + request.units[i].name;
            }
        }
    };

    // The calling thread is one of the workers, so the job progresses even if no thread can be started.
    const size_t workerCount = std::min(count, std::max<size_t>(m_limiter->capacity(), 1));
    std::vector<std::future<void>> helpers;
    for (size_t i = 1; i < workerCount; ++i) {
        try {
            helpers.push_back(std::async(std::launch::async, drainUnits));
        } catch (const std::system_error& e) {
            std::cerr << "[GradingOrchestrator] Running with " << helpers.size() + 1
                      << " unit worker(s); could not start more: " << e.what() << std::endl;
            break;
        }
    }
    drainUnits();
    for (auto& helper : helpers) helper.get();

    // Every unit finishes before the first failure, by unit order, is reported.
    for (const auto& error : errors) {
        if (error) throw std::runtime_error(*error);
    }
    std::vector<domain::GradedResult> results;
    results.reserve(count);
    for (auto& slot : slots) results.push_back(std::move(*slot));
    return results;
}

size_t GradingOrchestrator::persist(const std::vector<domain::GradedResult>& results,
                                    const std::optional<std::string>& assignmentCode) {
    if (!m_repository) return 0;
    try {
        const size_t written = m_repository->saveBatch(results, assignmentCode).size();
        if (written < results.size()) {
            std::cerr << "[GradingOrchestrator] Persisted " << written << " of " << results.size()
                      << " result(s)" << std::endl;
        }
        return written;
    } catch (const std::exception& e) {
        std::cerr << "[GradingOrchestrator] Batch save failed: " << e.what() << std::endl;
        return 0;
    }
}

void GradingOrchestrator::runJob(const std::string& jobId, const SubmissionRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    try {
        if (!m_jobs.update(jobId, [](domain::Job& job) { job.status = domain::JobStatus::Processing; })) {
            std::cerr << "[GradingOrchestrator] Job " << ShortId(jobId) << " expired before it started" << std::endl;
            return;
        }

        if (request.units.empty()) {
            markFailed(jobId, "No valid source files found.");
            return;
        }

        std::vector<domain::GradedResult> results = gradeAll(request);

        m_detector.annotate(results);

        for (auto& result : results) {
            result.name = DecorateName(request.studentName, result.name);
        }

        domain::JobSummary summary;
        summary.fileCount = results.size();
        summary.persistedCount = persist(results, request.assignmentCode);

        int scored = 0;
        double sum = 0.0;
        for (const auto& result : results) {
            if (!result.totalScore) continue;
            sum += *result.totalScore;
            ++scored;
        }
        if (scored > 0) summary.avgScore = std::round(sum / scored * 10.0) / 10.0;
        summary.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        const bool stored = m_jobs.update(jobId, [&results, &summary](domain::Job& job) {
            job.status = domain::JobStatus::Completed;
            job.results = results;
            job.summary = summary;
        });
        if (!stored) {
            std::cerr << "[GradingOrchestrator] Job " << ShortId(jobId)
                      << " expired before completion; job record dropped" << std::endl;
            return;
        }

        std::ostringstream line;
        line << std::fixed << std::setprecision(1) << "[GradingOrchestrator] Job " << ShortId(jobId)
             << " completed: " << summary.fileCount << " file(s), avg=";
        if (summary.avgScore) line << *summary.avgScore; else line << "n/a";
        line << ", time=" << summary.elapsedSeconds << "s";
        std::cout << line.str() << std::endl;

        if (request.callbackUrl) {
            scheduleNotification(jobId, *request.callbackUrl);
        }
    } catch (const std::exception& e) {
        markFailed(jobId, e.what());
    } catch (...) {
        markFailed(jobId, "Unknown error during grading.");
    }
}

void GradingOrchestrator::scheduleNotification(const std::string& jobId, const std::string& url) {
    if (!m_notifier) return;
    auto job = m_jobs.find(jobId);
    if (!job) return;

    std::shared_ptr<NotificationDispatcher> notifier = m_notifier;
    try {
        m_tasks->SubmitTask(TaskType::Notification, "Notify " + ShortId(jobId),
            [notifier, url, snapshot = *job](std::shared_ptr<TaskStatus> status) {
                if (!notifier->deliver(url, snapshot)) {
                    status->failed = true;
                    status->errorMessage = "Webhook delivery to " + url + " failed";
                }
            });
    } catch (const std::exception& e) {
        std::cerr << "[GradingOrchestrator] Could not queue notification for job " << ShortId(jobId)
                  << ": " << e.what() << std::endl;
    }
}

} // namespace codegrader::application
