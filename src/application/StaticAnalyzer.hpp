/**
 * @file StaticAnalyzer.hpp
 * @brief Static analysis pipeline for a single source unit.
 */

#pragma once
#include <memory>
#include "application/AlgorithmClassifier.hpp"
#include "application/FallbackScorer.hpp"
#include "application/FingerprintGenerator.hpp"
#include "application/SafetyScanner.hpp"
#include "application/SyntaxFeatureExtractor.hpp"
#include "domain/AnalysisResult.hpp"
#include "domain/SourceUnit.hpp"
#include "domain/SyntaxTree.hpp"

namespace codegrader::application {

/**
 * @class StaticAnalyzer
 * @brief Parse -> safety scan -> feature extraction -> classification -> fingerprint -> fallback score.
 *
 * Never throws for bad input: parse errors yield an invalid FAIL result and safety
 * violations an invalid FLAG result. Safe to share between threads.
 */
class StaticAnalyzer {
public:
    explicit StaticAnalyzer(std::shared_ptr<domain::SourceParser> parser);

    domain::AnalysisResult analyze(const domain::SourceUnit& unit) const;

private:
    static domain::AnalysisResult InvalidResult(const std::string& name, domain::GradeStatus status,
                                                std::vector<std::string> notes);

    std::shared_ptr<domain::SourceParser> m_parser;
    SafetyScanner m_scanner;
    SyntaxFeatureExtractor m_extractor;
    AlgorithmClassifier m_classifier;
    FingerprintGenerator m_fingerprints;
    FallbackScorer m_scorer;
};

} // namespace codegrader::application
