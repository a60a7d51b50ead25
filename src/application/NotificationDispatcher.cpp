/**
 * @file NotificationDispatcher.cpp
 * @brief Implementation of NotificationDispatcher.
 */

#include "application/NotificationDispatcher.hpp"
#include "infrastructure/ResultSerializer.hpp"
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace codegrader::application {

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<domain::CallbackTransport> transport,
                                               DeliveryPolicy policy,
                                               Sleeper sleeper)
    : m_transport(std::move(transport)), m_policy(policy), m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds wait) { std::this_thread::sleep_for(wait); };
    }
}

json NotificationDispatcher::BuildPayload(const domain::Job& job) {
    json results = json::array();
    if (job.results) {
        for (const auto& result : *job.results) {
            results.push_back(infrastructure::ResultSerializer::ToJson(result));
        }
    }
    return {
        {"event", "grading_completed"},
        {"job_id", job.id},
        {"results", results},
        {"summary", job.summary ? infrastructure::ResultSerializer::ToJson(*job.summary) : json::object()}
    };
}

bool NotificationDispatcher::deliver(const std::string& url, const domain::Job& job) const {
    return deliverPayload(url, BuildPayload(job).dump(-1, ' ', false, json::error_handler_t::replace));
}

bool NotificationDispatcher::deliverPayload(const std::string& url, const std::string& body) const {
    for (int attempt = 1; attempt <= m_policy.maxAttempts; ++attempt) {
        try {
            int status = m_transport->post(url, body);
            if (status >= 200 && status < 300) {
                std::cout << "[NotificationDispatcher] Webhook sent to '" << url << "' (attempt " << attempt << ")" << std::endl;
                return true;
            }
            std::cerr << "[NotificationDispatcher] Webhook attempt " << attempt << " failed: HTTP " << status << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[NotificationDispatcher] Webhook attempt " << attempt << " failed: " << e.what() << std::endl;
        }

        if (attempt < m_policy.maxAttempts) {
            m_sleeper(m_policy.backoffUnit * (1LL << attempt));
        }
    }
    std::cerr << "[NotificationDispatcher] Webhook to '" << url << "' failed after "
              << m_policy.maxAttempts << " attempts." << std::endl;
    return false;
}

} // namespace codegrader::application
