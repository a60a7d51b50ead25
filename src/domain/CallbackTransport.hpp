/**
 * @file CallbackTransport.hpp
 * @brief Outbound webhook transport.
 */

#pragma once
#include <string>

namespace codegrader::domain {

/**
 * @class CallbackTransport
 * @brief Posts a JSON document to an external endpoint.
 */
class CallbackTransport {
public:
    virtual ~CallbackTransport() = default;

    /**
     * @brief Performs one POST.
     * @param url Absolute callback URL.
     * @param jsonBody Serialized payload.
     * @return HTTP status code of the response.
     * @throws std::runtime_error on transport failure (no response).
     */
    virtual int post(const std::string& url, const std::string& jsonBody) = 0;
};

} // namespace codegrader::domain
