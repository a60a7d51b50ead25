/**
 * @file JobReaper.hpp
 * @brief Background thread that periodically purges expired jobs.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "application/JobStore.hpp"

namespace codegrader::application {

class JobReaper {
public:
    JobReaper(JobStore& store, std::chrono::milliseconds interval);
    ~JobReaper();

    JobReaper(const JobReaper&) = delete;
    JobReaper& operator=(const JobReaper&) = delete;

    void start();
    /** @brief Wakes the thread and joins it. Safe to call more than once. */
    void stop();

    bool isRunning() const;

private:
    void run();

    JobStore& m_store;
    std::chrono::milliseconds m_interval;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;
    std::thread m_thread;
};

} // namespace codegrader::application
