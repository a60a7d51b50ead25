#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "application/ReviewAdapter.hpp"
#include "application/StaticAnalyzer.hpp"
#include "application/SubmissionGrader.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/PythonParser.hpp"

using namespace codegrader;
using namespace codegrader::application;

// Mock reviewer returning a canned answer
class MockReviewer : public domain::CodeReviewer {
public:
    explicit MockReviewer(std::optional<std::string> answer, bool throws = false)
        : m_answer(std::move(answer)), m_throws(throws) {}

    std::optional<std::string> requestReview(const std::string& prompt) override {
        lastPrompt = prompt;
        ++calls;
        if (m_throws) throw std::runtime_error("connection refused");
        return m_answer;
    }

    std::string getCurrentModel() const override { return "mock-coder"; }

    std::string lastPrompt;
    int calls = 0;

private:
    std::optional<std::string> m_answer;
    bool m_throws;
};

class MockRubrics : public domain::RubricProvider {
public:
    explicit MockRubrics(std::optional<domain::RubricData> data) : m_data(std::move(data)) {}

    std::optional<domain::RubricData> fetch(const std::string& topicOrName) override {
        lastKey = topicOrName;
        return m_data;
    }

    std::string lastKey;

private:
    std::optional<domain::RubricData> m_data;
};

namespace {

const char* kCode =
    "def insertion_sort(arr):\n"
    "    for i in range(1, len(arr)):\n"
    "        key = arr[i]\n"
    "        j = i - 1\n"
    "        while j >= 0 and arr[j] > key:\n"
    "            arr[j + 1] = arr[j]\n"
    "            j -= 1\n"
    "        arr[j + 1] = key\n"
    "    return arr\n";

domain::RubricData SortingRubric() {
    domain::RubricData data;
    data.problemId = "insertion_sort";
    data.title = "Insertion Sort";
    data.rubric = "Correct ordering: 40 points. Stable: 20 points.";
    return data;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReviewAdapter Test..." << std::endl;

    StaticAnalyzer analyzer(std::make_shared<infrastructure::PythonParser>());
    const domain::AnalysisResult analysis = analyzer.analyze({"insertion.py", kCode});
    assert(analysis.valid && analysis.fallbackScore);
    const int fallbackTotal = analysis.fallbackScore->total;

    // --- Parsing ---
    assert(ReviewAdapter::StripCodeFence("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    assert(ReviewAdapter::StripCodeFence("  {\"a\": 1}  ") == "{\"a\": 1}");
    assert(ReviewAdapter::Clamp(nlohmann::json(140), 0, 100) == 100);
    assert(ReviewAdapter::Clamp(nlohmann::json(-3), 0, 40) == 0);
    assert(ReviewAdapter::Clamp(nlohmann::json("35"), 0, 40) == 35);
    assert(ReviewAdapter::Clamp(nlohmann::json(7.9), 0, 10) == 7);
    assert(ReviewAdapter::Clamp(nlohmann::json("high"), 0, 10) == 0);
    assert(!ReviewAdapter::ParseResponse("not json at all"));
    assert(!ReviewAdapter::ParseResponse("[1, 2, 3]"));

    auto scored = ReviewAdapter::ParseResponse(
        "```json\n"
        "{\"has_rubric\": true, \"total_score\": 120, \"detected_algo\": \"Insertion Sort\",\n"
        " \"breakdown\": {\"logic_score\": 50, \"algorithm_score\": 30, \"style_score\": 8, \"optimization_score\": -2},\n"
        " \"strengths\": \"Clear\", \"weaknesses\": \"None\", \"reasoning_feedback\": \"Good\",\n"
        " \"improvement_feedback\": \"Add tests\", \"complexity_analysis\": \"O(n^2)\"}\n"
        "```");
    assert(scored);
    assert(scored->aiScored && scored->hasRubric);
    assert(scored->totalScore && *scored->totalScore == 100);
    assert(scored->breakdown->logic == 40);
    assert(scored->breakdown->algorithm == 30);
    assert(scored->breakdown->style == 8);
    assert(scored->breakdown->optimization == 0);
    assert(scored->algorithms == "Insertion Sort");
    assert(scored->complexityAnalysis == "O(n^2)");

    // The reviewer's total is kept even when the parts disagree
    auto asymmetric = ReviewAdapter::ParseResponse(
        "{\"has_rubric\": true, \"total_score\": 90,"
        " \"breakdown\": {\"logic_score\": 10, \"algorithm_score\": 10, \"style_score\": 5, \"optimization_score\": 5}}");
    assert(asymmetric && *asymmetric->totalScore == 90);
    assert(asymmetric->breakdown->total == 90);
    assert(asymmetric->breakdown->sum() == 30);

    auto commentary = ReviewAdapter::ParseResponse("{\"has_rubric\": false, \"total_score\": 70}");
    assert(commentary && !commentary->hasRubric);
    assert(!commentary->totalScore && !commentary->breakdown);
    assert(commentary->reasoning == "No commentary provided.");
    assert(commentary->improvement == "No suggestions provided.");
    std::cout << "[PASS] Response parsing and clamping." << std::endl;

    // --- Reviewer unreachable, rubric present: structural fallback score ---
    auto unreachable = std::make_shared<MockReviewer>(std::nullopt);
    ReviewAdapter offline(unreachable);
    auto fallback = offline.review(kCode, analysis, SortingRubric());
    assert(unreachable->calls == 1);
    assert(!fallback.aiScored);
    assert(fallback.hasRubric);
    assert(fallback.totalScore && *fallback.totalScore == fallbackTotal);
    assert(fallback.breakdown->total == fallback.breakdown->sum());

    auto throwing = std::make_shared<MockReviewer>(std::nullopt, true);
    auto thrown = ReviewAdapter(throwing).review(kCode, analysis, SortingRubric());
    assert(!thrown.aiScored && thrown.totalScore && *thrown.totalScore == fallbackTotal);

    auto garbage = std::make_shared<MockReviewer>(std::string("I think this is fine"));
    auto garbled = ReviewAdapter(garbage).review(kCode, analysis, SortingRubric());
    assert(!garbled.aiScored && *garbled.totalScore == fallbackTotal);

    // No rubric, reviewer unreachable: no score at all
    auto noCriteria = offline.review(kCode, analysis, std::nullopt);
    assert(!noCriteria.hasRubric && !noCriteria.totalScore);
    assert(noCriteria.notes.size() == 1 && noCriteria.notes[0] == "Grading criteria not configured.");
    std::cout << "[PASS] Fallback when the reviewer is unavailable." << std::endl;

    // --- Prompt content ---
    auto reachable = std::make_shared<MockReviewer>(std::string(
        "{\"has_rubric\": false, \"reasoning_feedback\": \"Readable\", \"detected_algo\": \"Insertion Sort\"}"));
    auto online = ReviewAdapter(reachable).review(kCode, analysis, std::nullopt);
    assert(online.aiScored && !online.hasRubric && !online.totalScore);
    assert(online.reasoning == "Readable");
    assert(reachable->lastPrompt.find("insertion_sort(arr)") != std::string::npos);
    assert(reachable->lastPrompt.find(infrastructure::PromptCatalog::GetFeatureSummary(analysis)) != std::string::npos);

    ReviewAdapter(reachable).review(kCode, analysis, SortingRubric());
    assert(reachable->lastPrompt.find("Correct ordering: 40 points.") != std::string::npos);
    std::cout << "[PASS] Prompt carries code, features and rubric." << std::endl;

    // --- SubmissionGrader merge rules ---
    auto analyzerPtr = std::make_shared<StaticAnalyzer>(std::make_shared<infrastructure::PythonParser>());
    auto rubrics = std::make_shared<MockRubrics>(SortingRubric());
    SubmissionGrader grader(analyzerPtr, rubrics, std::make_shared<ReviewAdapter>(unreachable), 50);

    auto graded = grader.grade({"insertion.py", kCode}, std::string("insertion_sort"));
    assert(rubrics->lastKey == "insertion_sort");
    assert(graded.valid && graded.hasRubric && !graded.aiScored);
    assert(graded.totalScore && *graded.totalScore == fallbackTotal);
    assert(graded.status == (fallbackTotal >= 50 ? domain::GradeStatus::Pass : domain::GradeStatus::Fail));
    assert(graded.runtime.size() > 2 && graded.runtime.compare(graded.runtime.size() - 2, 2, "ms") == 0);
    assert(graded.fingerprint);

    grader.grade({"insertion.py", kCode}, std::nullopt);
    assert(rubrics->lastKey == "insertion.py");

    // Reviewer reachable, no rubric: pending with commentary
    SubmissionGrader commentaryGrader(analyzerPtr, std::make_shared<MockRubrics>(std::nullopt),
                                      std::make_shared<ReviewAdapter>(reachable), 50);
    auto pending = commentaryGrader.grade({"insertion.py", kCode}, std::nullopt);
    assert(pending.status == domain::GradeStatus::Pending);
    assert(!pending.totalScore && !pending.hasRubric && pending.aiScored);
    assert(pending.algorithms == "Insertion Sort");

    // Invalid units are final with a zero score
    auto invalid = grader.grade({"broken.py", "for x in\n"}, std::nullopt);
    assert(!invalid.valid && invalid.totalScore && *invalid.totalScore == 0);
    assert(invalid.status == domain::GradeStatus::Fail);
    assert(invalid.algorithms == "Analysis failed" && invalid.runtime == "0ms");

    auto unsafe = grader.grade({"unsafe.py", "exec('print(1)')\n"}, std::nullopt);
    assert(unsafe.status == domain::GradeStatus::Flag && *unsafe.totalScore == 0);

    // Threshold boundary
    ReviewOutcome boundary;
    boundary.hasRubric = true;
    boundary.totalScore = 50;
    assert(SubmissionGrader::Merge(analysis, boundary, 50).status == domain::GradeStatus::Pass);
    boundary.totalScore = 49;
    assert(SubmissionGrader::Merge(analysis, boundary, 50).status == domain::GradeStatus::Fail);

    ReviewOutcome bare;
    domain::AnalysisResult plain = analysis;
    plain.algorithms.clear();
    assert(SubmissionGrader::Merge(plain, bare, 50).algorithms == "Basic Logic");
    assert(SubmissionGrader::FormatRuntime(12.6) == "13ms");
    std::cout << "[PASS] SubmissionGrader merge rules." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
