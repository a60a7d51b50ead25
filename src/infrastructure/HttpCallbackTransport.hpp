/**
 * @file HttpCallbackTransport.hpp
 * @brief CallbackTransport over cpp-httplib.
 */

#pragma once
#include "domain/CallbackTransport.hpp"

namespace codegrader::infrastructure {

class HttpCallbackTransport : public domain::CallbackTransport {
public:
    explicit HttpCallbackTransport(int timeoutSeconds = 10);

    /** @throws std::runtime_error when no response was received. */
    int post(const std::string& url, const std::string& jsonBody) override;

private:
    int m_timeoutSeconds;
};

} // namespace codegrader::infrastructure
