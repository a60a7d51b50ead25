/**
 * @file ConcurrencyLimiter.cpp
 * @brief Implementation of ConcurrencyLimiter.
 */

#include "application/ConcurrencyLimiter.hpp"
#include <algorithm>
#include <stdexcept>

namespace codegrader::application {

ConcurrencyLimiter::ConcurrencyLimiter(size_t capacity) : m_capacity(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("ConcurrencyLimiter capacity must be positive");
    }
}

void ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_inUse < m_capacity; });
    ++m_inUse;
    m_peak = std::max(m_peak, m_inUse);
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_inUse;
    }
    m_cv.notify_one();
}

size_t ConcurrencyLimiter::inUse() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inUse;
}

size_t ConcurrencyLimiter::peakInUse() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peak;
}

ConcurrencyLimiter::Permit::Permit(ConcurrencyLimiter& limiter) : m_limiter(limiter) {
    m_limiter.acquire();
}

ConcurrencyLimiter::Permit::~Permit() {
    m_limiter.release();
}

} // namespace codegrader::application
