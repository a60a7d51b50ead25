/**
 * @file UuidGenerator.hpp
 * @brief Random (version 4) UUIDs via libuuid.
 */

#pragma once
#include <string>

namespace codegrader::infrastructure {

class UuidGenerator {
public:
    /** @brief Returns a lowercase 36-character UUID string. */
    static std::string Generate();
};

} // namespace codegrader::infrastructure
