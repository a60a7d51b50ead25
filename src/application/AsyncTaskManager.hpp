/**
 * @file AsyncTaskManager.hpp
 * @brief Bounded worker pool for background jobs and notifications.
 */

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <tuple>

namespace codegrader::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Grading,
    Notification
};

inline const char* TaskTypeName(TaskType type) {
    return type == TaskType::Grading ? "Grading" : "Notification";
}

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 *
 * A task may report its own failure by setting failed and errorMessage before
 * returning; a thrown exception is recorded the same way.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Runs submitted tasks on a fixed set of worker threads.
 *
 * Tasks may submit further tasks. Shutdown() stops intake, lets the workers
 * drain everything already queued and joins them.
 */
class AsyncTaskManager {
public:
    explicit AsyncTaskManager(size_t workerCount = 4) {
        if (workerCount == 0) workerCount = 1;
        m_workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            m_workers.emplace_back([this]() { WorkerLoop(); });
        }
    }

    ~AsyncTaskManager() {
        Shutdown();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Queues a task. The callable receives its TaskStatus followed by args.
     * @throws std::runtime_error after Shutdown().
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        std::function<void()> run =
            [status, userFunc = std::forward<F>(f), userArgs = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                std::apply([&](auto&... unpacked) { userFunc(status, std::move(unpacked)...); }, userArgs);
            };

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            if (m_stopping) {
                throw std::runtime_error("AsyncTaskManager is shut down; rejected task: " + description);
            }
            m_queue.push_back(QueuedTask{status, std::move(run)});
        }
        m_workAvailable.notify_one();
        return status;
    }

    /** @brief Blocks until the queue is empty and no task is running. */
    void WaitForIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this]() { return m_queue.empty() && m_running == 0; });
    }

    /** @brief Drains queued and in-flight tasks, then joins the workers. Idempotent. */
    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_stopping = true;
        }
        m_workAvailable.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    /** @brief Number of finished tasks that threw or reported failure. */
    size_t FailedTaskCount() const { return m_failedCount.load(); }

private:
    struct QueuedTask {
        std::shared_ptr<TaskStatus> status;
        std::function<void()> run;
    };

    void WorkerLoop() {
        while (true) {
            QueuedTask task;
            {
                std::unique_lock<std::mutex> lock(m_tasksMutex);
                m_workAvailable.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
                if (m_queue.empty()) return; // stopping and drained
                task = std::move(m_queue.front());
                m_queue.pop_front();
                ++m_running;
            }

            TaskStatus& status = *task.status;
            try {
                task.run();
            } catch (const std::exception& e) {
                status.failed = true;
                status.errorMessage = e.what();
            } catch (...) {
                status.failed = true;
                status.errorMessage = "Unknown error during task execution.";
            }
            if (status.failed) {
                ++m_failedCount;
                std::cerr << "[AsyncTaskManager] " << TaskTypeName(status.type) << " task #" << status.id << " '"
                          << status.description << "' failed: " << status.errorMessage << std::endl;
            }
            status.isCompleted = true;

            {
                std::lock_guard<std::mutex> lock(m_tasksMutex);
                --m_running;
                if (m_queue.empty() && m_running == 0) m_idle.notify_all();
            }
        }
    }

    std::atomic<int> m_nextId{0};
    std::atomic<size_t> m_failedCount{0};
    std::deque<QueuedTask> m_queue;
    size_t m_running = 0;
    bool m_stopping = false;
    std::mutex m_tasksMutex;
    std::condition_variable m_workAvailable;
    std::condition_variable m_idle;
    std::vector<std::thread> m_workers;
};

} // namespace codegrader::application
