/**
 * @file FingerprintGenerator.cpp
 * @brief Implementation of FingerprintGenerator.
 */

#include "application/FingerprintGenerator.hpp"

namespace codegrader::application {

std::optional<domain::Fingerprint> FingerprintGenerator::generate(const std::vector<std::string>& tokens) const {
    if (tokens.size() < kShingleSize) return std::nullopt;

    domain::Fingerprint shingles;
    for (size_t i = 0; i + kShingleSize <= tokens.size(); ++i) {
        shingles.insert(tokens[i] + "-" + tokens[i + 1] + "-" + tokens[i + 2]);
    }
    return shingles;
}

} // namespace codegrader::application
