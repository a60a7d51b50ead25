#include "infrastructure/PromptCatalog.hpp"
#include <sstream>

namespace codegrader::infrastructure {

std::string PromptCatalog::GetReviewerPersona() {
    return
        "You are a senior full-stack developer with 10 years of experience reviewing a student's "
        "data structures and algorithms submission. Grade it as strictly as a real pull request.\n\n"
        "YOUR STYLE:\n"
        "- Be direct. If the code is bad, say so.\n"
        "- Always ask: would you merge this into production? If not, it does not deserve a high score.\n"
        "- Working code is not the same as good code.\n"
        "- Pay attention to naming, readability, edge cases, Big-O and whether the solution is smart or merely runs.\n\n"
        "DEDUCTIONS:\n"
        "- Runs but the logic is wrong: -15 to -20.\n"
        "- Each unhandled edge case (empty input, None, negatives, duplicates): -5 to -10.\n"
        "- Hardcoded results: 0 points.\n"
        "- Brute force O(n^2) where O(n log n) or O(n) exists: -15 to -20.\n"
        "- Meaningless names such as a, b, x, temp, data1: -3 to -5.\n"
        "- No comments or docstrings: -3.\n"
        "- Copy-pasted repetition: -5.\n"
        "- Unused imports, dead code or leftover debug prints: -2 to -3.\n\n"
        "SCORE BANDS:\n"
        "- 90-100: excellent, production quality, optimal complexity.\n"
        "- 75-89: good idea and fitting algorithm with room to improve.\n"
        "- 60-74: average, works but still junior code.\n"
        "- 40-59: weak, logic errors or an unsuitable algorithm.\n"
        "- 0-39: failing, fundamentally wrong or hardcoded.";
}

std::string PromptCatalog::GetRubricSection(const std::optional<domain::RubricData>& rubric) {
    if (rubric && rubric->rubric && !rubric->rubric->empty()) {
        return "GRADING CRITERIA (from the question bank):\n" + *rubric->rubric;
    }
    if (rubric && rubric->requirements && !rubric->requirements->empty()) {
        return "PROBLEM REQUIREMENTS:\n" + *rubric->requirements +
               "\n\nGRADING CRITERIA: the question bank has no specific rubric for this problem.\n"
               "Grade on logical correctness, algorithm quality, code style and optimization.";
    }
    return
        "NOTE: no grading criteria are available for this problem.\n"
        "Review the code on:\n"
        "- Is the logic correct?\n"
        "- Does the algorithm fit the problem?\n"
        "- Is the code clean and readable?\n"
        "- Is it optimized?\n"
        "Do NOT assign a score. Comment and suggest only.";
}

std::string PromptCatalog::GetFeatureSummary(const domain::AnalysisResult& analysis) {
    std::string algorithms;
    for (const auto& label : analysis.algorithms) {
        if (!algorithms.empty()) algorithms += ", ";
        algorithms += label;
    }
    if (algorithms.empty()) algorithms = "Basic Logic";

    std::ostringstream ss;
    ss << std::boolalpha
       << "Algorithms: " << algorithms
       << " | Complexity: " << analysis.complexity
       << " | Loops: " << analysis.summary.loops
       << " | Recursion: " << analysis.summary.recursion
       << " | Classes: " << analysis.summary.classDefined
       << " | Functions: " << analysis.summary.functions;
    return ss.str();
}

std::string PromptCatalog::GetResponseContract(bool hasCriteria) {
    return std::string(
        "REPLY WITH JSON ONLY (no markdown, no extra text):\n"
        "{\n"
        "  \"has_rubric\": ") + (hasCriteria ? "true" : "false") + ",\n"
        "  \"total_score\": <0-100 when criteria exist, null otherwise>,\n"
        "  \"breakdown\": {\n"
        "    \"logic_score\": <0-40>,\n"
        "    \"algorithm_score\": <0-40>,\n"
        "    \"style_score\": <0-10>,\n"
        "    \"optimization_score\": <0-10>\n"
        "  },\n"
        "  \"detected_algo\": \"<algorithm name, e.g. Binary Search, BFS, Merge Sort>\",\n"
        "  \"strengths\": \"<2-3 points that deserve credit>\",\n"
        "  \"weaknesses\": \"<2-4 concrete review comments>\",\n"
        "  \"reasoning_feedback\": \"<5-7 sentences written as a PR review>\",\n"
        "  \"improvement_feedback\": \"<concrete suggestions, most severe first>\",\n"
        "  \"complexity_analysis\": \"<Time: O(?), Space: O(?) with explanation>\"\n"
        "}";
}

std::string PromptCatalog::BuildReviewPrompt(const std::string& code,
                                             const domain::AnalysisResult& analysis,
                                             const std::optional<domain::RubricData>& rubric) {
    const bool hasCriteria = rubric && rubric->hasCriteria();
    return GetReviewerPersona() + "\n\n" +
           GetRubricSection(rubric) + "\n\n" +
           "STATIC ANALYSIS:\n" + GetFeatureSummary(analysis) + "\n\n" +
           "SOURCE UNDER REVIEW:\n```python\n" + code + "\n```\n\n" +
           GetResponseContract(hasCriteria);
}

} // namespace codegrader::infrastructure
