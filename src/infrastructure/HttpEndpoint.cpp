#include "infrastructure/HttpEndpoint.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace codegrader::infrastructure {

HttpEndpoint HttpEndpoint::Parse(const std::string& url) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("URL without scheme: " + url);
    }
    const size_t pathStart = url.find('/', schemeEnd + 3);

    HttpEndpoint endpoint;
    endpoint.base = url.substr(0, pathStart);
    if (endpoint.base.size() <= schemeEnd + 3) {
        throw std::invalid_argument("URL without host: " + url);
    }
    if (pathStart != std::string::npos) {
        endpoint.path = url.substr(pathStart);
    }
    return endpoint;
}

std::string HttpEndpoint::EncodePathSegment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (char ch : segment) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            out.push_back(ch);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace codegrader::infrastructure
