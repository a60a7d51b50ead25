#include "infrastructure/HttpCallbackTransport.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include <httplib.h>
#include <stdexcept>

namespace codegrader::infrastructure {

HttpCallbackTransport::HttpCallbackTransport(int timeoutSeconds) : m_timeoutSeconds(timeoutSeconds) {}

int HttpCallbackTransport::post(const std::string& url, const std::string& jsonBody) {
    HttpEndpoint endpoint = HttpEndpoint::Parse(url);

    httplib::Client cli(endpoint.base);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    auto res = cli.Post(endpoint.path, jsonBody, "application/json");
    if (!res) {
        throw std::runtime_error("Connection to " + endpoint.base + " failed (error " +
                                 std::to_string(static_cast<int>(res.error())) + ")");
    }
    return res->status;
}

} // namespace codegrader::infrastructure
