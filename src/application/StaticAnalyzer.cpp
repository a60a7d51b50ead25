/**
 * @file StaticAnalyzer.cpp
 * @brief Implementation of StaticAnalyzer.
 */

#include "application/StaticAnalyzer.hpp"
#include <chrono>
#include <iostream>

namespace codegrader::application {

StaticAnalyzer::StaticAnalyzer(std::shared_ptr<domain::SourceParser> parser)
    : m_parser(std::move(parser)) {}

domain::AnalysisResult StaticAnalyzer::InvalidResult(const std::string& name, domain::GradeStatus status,
                                                     std::vector<std::string> notes) {
    domain::AnalysisResult result;
    result.name = name;
    result.valid = false;
    result.status = status;
    result.notes = std::move(notes);
    return result;
}

domain::AnalysisResult StaticAnalyzer::analyze(const domain::SourceUnit& unit) const {
    const auto start = std::chrono::steady_clock::now();

    std::unique_ptr<domain::SyntaxNode> tree;
    try {
        tree = m_parser->parse(unit.text);
    } catch (const domain::ParseError& e) {
        return InvalidResult(unit.name, domain::GradeStatus::Fail,
                             {"Syntax error at line " + std::to_string(e.line()) + ": " + e.what()});
    } catch (const std::exception& e) {
        std::cerr << "[StaticAnalyzer] Parser failure on " << unit.name << ": " << e.what() << std::endl;
        return InvalidResult(unit.name, domain::GradeStatus::Fail, {std::string("Analysis error: ") + e.what()});
    }

    auto violations = m_scanner.scan(*tree);
    if (!violations.empty()) {
        std::cout << "[StaticAnalyzer] " << unit.name << ": " << violations.size()
                  << " security violation(s)" << std::endl;
        violations.insert(violations.begin(), "Security violation");
        return InvalidResult(unit.name, domain::GradeStatus::Flag, std::move(violations));
    }

    domain::FeatureRecord features;
    try {
        features = m_extractor.extract(*tree);
    } catch (const std::exception& e) {
        std::cerr << "[StaticAnalyzer] Feature extraction failed on " << unit.name << ": " << e.what() << std::endl;
        return InvalidResult(unit.name, domain::GradeStatus::Fail, {std::string("Analysis error: ") + e.what()});
    }

    domain::AnalysisResult result;
    result.name = unit.name;
    result.valid = true;
    result.algorithms = m_classifier.classify(features);
    result.complexity = features.complexity();
    result.maxLoopDepth = features.maxLoopDepth;
    result.fingerprint = m_fingerprints.generate(features.nodeTokens);
    result.fallbackScore = m_scorer.score(features, result.algorithms);
    result.summary.loops = features.loops;
    result.summary.conditionals = features.conditionals;
    result.summary.functions = features.functionCount;
    result.summary.recursion = features.recursion;
    result.summary.classDefined = features.classDefined;

    result.runtimeMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return result;
}

} // namespace codegrader::application
