/**
 * @file ReviewAdapter.cpp
 * @brief Implementation of ReviewAdapter.
 */

#include "application/ReviewAdapter.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace codegrader::application {

namespace {

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string TextField(const json& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump(-1, ' ', false, json::error_handler_t::replace);
}

bool IsTruthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return !value.empty();
    return false;
}

} // namespace

ReviewAdapter::ReviewAdapter(std::shared_ptr<domain::CodeReviewer> reviewer)
    : m_reviewer(std::move(reviewer)) {}

std::string ReviewAdapter::StripCodeFence(const std::string& raw) {
    std::string clean = Trim(raw);
    if (clean.rfind("```", 0) != 0) return clean;

    clean.erase(0, 3);
    if (clean.rfind("json", 0) == 0) clean.erase(0, 4);
    clean = Trim(clean);
    if (clean.size() >= 3 && clean.compare(clean.size() - 3, 3, "```") == 0) {
        clean.erase(clean.size() - 3);
    }
    return Trim(clean);
}

int ReviewAdapter::Clamp(const json& value, int lo, int hi) {
    long long number = lo;
    if (value.is_boolean()) {
        number = value.get<bool>() ? 1 : 0;
    } else if (value.is_number_integer()) {
        number = value.get<long long>();
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d)) return lo;
        number = static_cast<long long>(std::trunc(std::max(-1e12, std::min(d, 1e12))));
    } else if (value.is_string()) {
        std::string text = Trim(value.get<std::string>());
        if (text.empty()) return lo;
        try {
            size_t consumed = 0;
            number = std::stoll(text, &consumed);
            if (consumed != text.size()) return lo;
        } catch (const std::exception&) {
            return lo;
        }
    } else {
        return lo;
    }
    return static_cast<int>(std::max<long long>(lo, std::min<long long>(number, hi)));
}

std::optional<ReviewOutcome> ReviewAdapter::ParseResponse(const std::string& raw) {
    json data;
    try {
        data = json::parse(StripCodeFence(raw));
    } catch (const json::exception& e) {
        std::cerr << "[ReviewAdapter] Failed to parse reviewer JSON: " << e.what()
                  << " | Raw: " << raw.substr(0, 200) << std::endl;
        return std::nullopt;
    }
    if (!data.is_object()) {
        std::cerr << "[ReviewAdapter] Reviewer response is not a JSON object." << std::endl;
        return std::nullopt;
    }

    ReviewOutcome outcome;
    outcome.aiScored = true;
    outcome.algorithms = TextField(data, "detected_algo", "");
    outcome.strengths = TextField(data, "strengths", "");
    outcome.weaknesses = TextField(data, "weaknesses", "");
    outcome.complexityAnalysis = TextField(data, "complexity_analysis", "");

    const bool hasRubric = data.contains("has_rubric") && IsTruthy(data["has_rubric"]);
    const bool hasTotal = data.contains("total_score") && !data["total_score"].is_null();

    if (!hasRubric || !hasTotal) {
        outcome.hasRubric = false;
        outcome.reasoning = TextField(data, "reasoning_feedback", "No commentary provided.");
        outcome.improvement = TextField(data, "improvement_feedback", "No suggestions provided.");
        return outcome;
    }

    outcome.hasRubric = true;
    outcome.reasoning = TextField(data, "reasoning_feedback", "");
    outcome.improvement = TextField(data, "improvement_feedback", "");
    outcome.totalScore = Clamp(data["total_score"], 0, domain::ScoreBreakdown::kMaxTotal);

    const json breakdown = data.contains("breakdown") && data["breakdown"].is_object() ? data["breakdown"]
                                                                                       : json::object();
    auto part = [&breakdown](const char* key, int hi) {
        return breakdown.contains(key) ? Clamp(breakdown[key], 0, hi) : 0;
    };

    domain::ScoreBreakdown scores;
    scores.logic = part("logic_score", domain::ScoreBreakdown::kMaxLogic);
    scores.algorithm = part("algorithm_score", domain::ScoreBreakdown::kMaxAlgorithm);
    scores.style = part("style_score", domain::ScoreBreakdown::kMaxStyle);
    scores.optimization = part("optimization_score", domain::ScoreBreakdown::kMaxOptimization);
    // The reviewer's total is kept as given (clamped); it is not recomputed from the parts.
    scores.total = *outcome.totalScore;
    outcome.breakdown = scores;
    return outcome;
}

ReviewOutcome ReviewAdapter::Fallback(const domain::AnalysisResult& analysis, bool hasCriteria) {
    ReviewOutcome outcome;
    outcome.hasRubric = hasCriteria;
    outcome.aiScored = false;

    if (hasCriteria) {
        domain::ScoreBreakdown scores = analysis.fallbackScore.value_or(domain::ScoreBreakdown{});
        outcome.totalScore = scores.total;
        outcome.breakdown = scores;
        outcome.reasoning = "Assessment based on structural code analysis (AST).";
    } else {
        outcome.reasoning =
            "Not connected to the question bank. Only the code structure was analyzed; no score was assigned.";
        outcome.notes.push_back("Grading criteria not configured.");
    }
    return outcome;
}

ReviewOutcome ReviewAdapter::review(const std::string& code,
                                    const domain::AnalysisResult& analysis,
                                    const std::optional<domain::RubricData>& rubric) const {
    const bool hasCriteria = rubric && rubric->hasCriteria();
    if (!m_reviewer) {
        return Fallback(analysis, hasCriteria);
    }

    const std::string prompt = infrastructure::PromptCatalog::BuildReviewPrompt(code, analysis, rubric);

    std::optional<std::string> raw;
    try {
        raw = m_reviewer->requestReview(prompt);
    } catch (const std::exception& e) {
        std::cerr << "[ReviewAdapter] Reviewer call failed for " << analysis.name << ": " << e.what() << std::endl;
        return Fallback(analysis, hasCriteria);
    }

    if (!raw || Trim(*raw).empty()) {
        std::cerr << "[ReviewAdapter] Reviewer unavailable for " << analysis.name << ". Using fallback." << std::endl;
        return Fallback(analysis, hasCriteria);
    }

    auto parsed = ParseResponse(*raw);
    if (!parsed) {
        return Fallback(analysis, hasCriteria);
    }
    return *parsed;
}

} // namespace codegrader::application
