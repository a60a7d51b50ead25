/**
 * @file ConcurrencyLimiter.hpp
 * @brief Process-wide cap on simultaneous grading steps.
 */

#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace codegrader::application {

/**
 * @class ConcurrencyLimiter
 * @brief Counting semaphore. Hold a Permit for the duration of a guarded step.
 */
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @class Permit
     * @brief RAII slot; blocks on construction until a slot is free, releases on destruction.
     */
    class Permit {
    public:
        explicit Permit(ConcurrencyLimiter& limiter);
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        ConcurrencyLimiter& m_limiter;
    };

    size_t capacity() const { return m_capacity; }
    size_t inUse() const;
    /** @brief Highest number of permits held at the same time since construction. */
    size_t peakInUse() const;

private:
    void acquire();
    void release();

    const size_t m_capacity;
    size_t m_inUse = 0;
    size_t m_peak = 0;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace codegrader::application
