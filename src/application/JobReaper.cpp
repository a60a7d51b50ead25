/**
 * @file JobReaper.cpp
 * @brief Implementation of JobReaper.
 */

#include "application/JobReaper.hpp"
#include <iostream>

namespace codegrader::application {

JobReaper::JobReaper(JobStore& store, std::chrono::milliseconds interval)
    : m_store(store), m_interval(interval) {}

JobReaper::~JobReaper() {
    stop();
}

void JobReaper::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) return;
    m_stopRequested = false;
    m_thread = std::thread([this]() { run(); });
}

void JobReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();
}

bool JobReaper::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable() && !m_stopRequested;
}

void JobReaper::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested) {
        if (m_cv.wait_for(lock, m_interval, [this]() { return m_stopRequested; })) break;
        lock.unlock();
        try {
            m_store.sweepExpired();
        } catch (const std::exception& e) {
            std::cerr << "[JobReaper] Sweep failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

} // namespace codegrader::application
