/**
 * @file SimilarityDetector.hpp
 * @brief Pairwise fingerprint comparison inside one submission batch.
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "domain/AnalysisResult.hpp"

namespace codegrader::application {

/**
 * @class SimilarityDetector
 * @brief Jaccard similarity over 3-shingle fingerprints.
 *
 * Works on any result type exposing `name`, `fingerprint`, `notes` and `status`
 * (GradedResult in production).
 */
class SimilarityDetector {
public:
    static constexpr double kDefaultThreshold = 0.85;

    explicit SimilarityDetector(double threshold = kDefaultThreshold) : m_threshold(threshold) {}

    double threshold() const { return m_threshold; }

    /** @brief |A ∩ B| / |A ∪ B|, or 0 when both sets are empty. */
    static double Similarity(const domain::Fingerprint& a, const domain::Fingerprint& b);

    static std::string WarningMessage(double similarity, const std::string& otherName);

    /**
     * @brief Flags every pair whose similarity is strictly above the threshold, then
     * strips all fingerprints.
     * @return Number of flagged pairs.
     */
    template <typename Result>
    size_t annotate(std::vector<Result>& results) const {
        size_t flaggedPairs = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            if (!results[i].fingerprint) continue;
            for (size_t j = i + 1; j < results.size(); ++j) {
                if (!results[j].fingerprint) continue;

                const double similarity = Similarity(*results[i].fingerprint, *results[j].fingerprint);
                if (similarity <= m_threshold) continue;

                AddWarning(results[i], WarningMessage(similarity, results[j].name));
                AddWarning(results[j], WarningMessage(similarity, results[i].name));
                ++flaggedPairs;
                std::cerr << "[SimilarityDetector] Overlap: '" << results[i].name << "' <-> '"
                          << results[j].name << "' (" << std::lround(similarity * 100) << "%)" << std::endl;
            }
        }

        for (auto& result : results) result.fingerprint.reset();
        return flaggedPairs;
    }

private:
    template <typename Result>
    static void AddWarning(Result& result, const std::string& message) {
        if (std::find(result.notes.begin(), result.notes.end(), message) == result.notes.end()) {
            result.notes.push_back(message);
        }
        result.status = domain::GradeStatus::Flag;
    }

    double m_threshold;
};

} // namespace codegrader::application
