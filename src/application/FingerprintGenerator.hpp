/**
 * @file FingerprintGenerator.hpp
 * @brief Builds the 3-shingle fingerprint of a node-type token stream.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/AnalysisResult.hpp"

namespace codegrader::application {

class FingerprintGenerator {
public:
    static constexpr size_t kShingleSize = 3;

    /**
     * @brief Every contiguous run of three tokens, joined with '-'.
     * @return std::nullopt when fewer than three tokens exist.
     */
    std::optional<domain::Fingerprint> generate(const std::vector<std::string>& tokens) const;
};

} // namespace codegrader::application
