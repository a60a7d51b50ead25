/**
 * @file SimilarityDetector.cpp
 * @brief Implementation of SimilarityDetector.
 */

#include "application/SimilarityDetector.hpp"

namespace codegrader::application {

double SimilarityDetector::Similarity(const domain::Fingerprint& a, const domain::Fingerprint& b) {
    size_t intersection = 0;
    for (const auto& shingle : a) {
        if (b.count(shingle)) ++intersection;
    }
    const size_t unionSize = a.size() + b.size() - intersection;
    if (unionSize == 0) return 0.0;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

std::string SimilarityDetector::WarningMessage(double similarity, const std::string& otherName) {
    return "WARNING: " + std::to_string(std::lround(similarity * 100)) + "% overlap with submission " + otherName;
}

} // namespace codegrader::application
