/**
 * @file NotificationDispatcher.hpp
 * @brief Webhook delivery of completed jobs with bounded retries.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/CallbackTransport.hpp"
#include "domain/Job.hpp"

namespace codegrader::application {

struct DeliveryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds backoffUnit{1000};
};

/**
 * @class NotificationDispatcher
 * @brief POSTs a "grading_completed" event; retries with 2^k backoff.
 *
 * After failed attempt k (1-based, k < maxAttempts) it waits 2^k * backoffUnit.
 * There is no wait after the last attempt. deliver() never throws.
 */
class NotificationDispatcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param transport HTTP (or test) transport.
     * @param policy Attempt count and backoff unit.
     * @param sleeper Wait primitive; std::this_thread::sleep_for when empty.
     */
    NotificationDispatcher(std::shared_ptr<domain::CallbackTransport> transport,
                           DeliveryPolicy policy = {},
                           Sleeper sleeper = nullptr);

    /** @brief Delivers the completion event of a job. @return true on a 2xx response. */
    bool deliver(const std::string& url, const domain::Job& job) const;

    bool deliverPayload(const std::string& url, const std::string& body) const;

    static nlohmann::json BuildPayload(const domain::Job& job);

private:
    std::shared_ptr<domain::CallbackTransport> m_transport;
    DeliveryPolicy m_policy;
    Sleeper m_sleeper;
};

} // namespace codegrader::application
