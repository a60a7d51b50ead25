/**
 * @file HttpEndpoint.hpp
 * @brief Splits absolute URLs into the parts cpp-httplib expects.
 */

#pragma once
#include <string>

namespace codegrader::infrastructure {

/**
 * @struct HttpEndpoint
 * @brief "http://host:8000/api/x" -> base "http://host:8000", path "/api/x".
 */
struct HttpEndpoint {
    std::string base;
    std::string path = "/";

    /** @throws std::invalid_argument when the URL has no scheme or host. */
    static HttpEndpoint Parse(const std::string& url);

    /** @brief Percent-encodes everything outside the RFC 3986 unreserved set. */
    static std::string EncodePathSegment(const std::string& segment);
};

} // namespace codegrader::infrastructure
