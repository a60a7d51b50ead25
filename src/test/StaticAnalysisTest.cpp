#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "application/AlgorithmClassifier.hpp"
#include "application/FallbackScorer.hpp"
#include "application/FingerprintGenerator.hpp"
#include "application/SafetyScanner.hpp"
#include "application/StaticAnalyzer.hpp"
#include "application/SyntaxFeatureExtractor.hpp"
#include "infrastructure/PythonParser.hpp"

using namespace codegrader;
using namespace codegrader::application;

namespace {

const char* kBubbleSort =
    "def bubble_sort(arr):\n"
    "    n = len(arr)\n"
    "    for i in range(n):\n"
    "        for j in range(0, n - i - 1):\n"
    "            if arr[j] > arr[j + 1]:\n"
    "                arr[j], arr[j + 1] = arr[j + 1], arr[j]\n"
    "    return arr\n";

const char* kBinarySearch =
    "def search(arr, target):\n"
    "    lo, hi = 0, len(arr) - 1\n"
    "    while lo <= hi:\n"
    "        mid = (lo + hi) // 2\n"
    "        if arr[mid] == target:\n"
    "            return mid\n"
    "        if arr[mid] < target:\n"
    "            lo = mid + 1\n"
    "        else:\n"
    "            hi = mid - 1\n"
    "    return -1\n";

const char* kFibonacci =
    "def fib(n):\n"
    "    memo = {}\n"
    "    if n < 2:\n"
    "        return n\n"
    "    return fib(n - 1) + fib(n - 2)\n";

domain::FeatureRecord Extract(const std::string& source) {
    infrastructure::PythonParser parser;
    auto tree = parser.parse(source);
    return SyntaxFeatureExtractor().extract(*tree);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Static Analysis Test..." << std::endl;

    // --- Feature extraction ---
    auto bubble = Extract(kBubbleSort);
    assert(bubble.loops == 2);
    assert(bubble.nestedLoops);
    assert(bubble.maxLoopDepth == 2);
    assert(bubble.conditionals == 1);
    assert(bubble.functionCount == 1);
    assert(bubble.hints.swap);
    assert(!bubble.recursion);
    assert(bubble.complexity() == 4);

    auto search = Extract(kBinarySearch);
    assert(search.hints.halving);
    assert(search.loops == 1 && !search.nestedLoops);
    assert(search.conditionals == 2);

    auto fib = Extract(kFibonacci);
    assert(fib.recursion);
    assert(fib.hints.memo);
    assert(fib.dataStructures.mapping);

    auto matrix = Extract("grid = [[0] * 3 for _ in range(3)]\ngrid[1][2] = 5\n");
    assert(matrix.hints.matrix);
    assert(matrix.dataStructures.sequence);

    auto collections = Extract("from collections import deque\nq = deque()\n");
    assert(collections.dataStructures.deque);
    assert(collections.imports.count("collections"));

    // A shift by one outside a loop is not a halving hint
    auto shifted = Extract("x = 10 >> 1\n");
    assert(!shifted.hints.halving);

    // '2' as a string never counts as the literal 2
    auto quoted = Extract("while x:\n    x = x // '2'\n");
    assert(!quoted.hints.halving);
    std::cout << "[PASS] Feature extraction." << std::endl;

    // --- Classification ---
    AlgorithmClassifier classifier;
    auto bubbleLabels = classifier.classify(bubble);
    assert(bubbleLabels.count("Nested Loops"));
    assert(bubbleLabels.count("Swap Pattern"));
    assert(bubbleLabels.count("Bubble Sort"));
    assert(!bubbleLabels.count("Iterative Logic"));

    auto searchLabels = classifier.classify(search);
    assert(searchLabels.count("Binary Search"));
    assert(searchLabels.count("Iterative Logic"));

    auto fibLabels = classifier.classify(fib);
    assert(fibLabels.count("Recursion"));
    assert(fibLabels.count("Dynamic Programming"));

    auto stackLabels = classifier.classify(Extract("items = []\nitems.append(1)\nitems.pop()\n"));
    assert(stackLabels.count("Stack/Queue Operations"));

    auto explicitStack = classifier.classify(Extract("stack = []\nstack.append(1)\nstack.pop()\n"));
    assert(explicitStack.count("Stack"));
    assert(!explicitStack.count("Stack/Queue Operations"));

    assert(classifier.classify(Extract("print('hello')\n")).empty());
    std::cout << "[PASS] Algorithm classification." << std::endl;

    // --- Safety scanner ---
    infrastructure::PythonParser parser;
    SafetyScanner scanner;
    auto unsafe = scanner.scan(*parser.parse("import os.path\nfrom subprocess import run\neval('1')\n"));
    assert(unsafe.size() == 3);
    assert(unsafe[0] == "Forbidden import: os.path");
    assert(unsafe[1] == "Forbidden module import: subprocess");
    assert(unsafe[2] == "Unsafe call: eval()");
    assert(scanner.scan(*parser.parse("import math\nfrom collections import deque\nprint(len([]))\n")).empty());
    // Attribute calls are not flagged, only bare names
    assert(scanner.scan(*parser.parse("obj.open()\n")).empty());
    assert(SafetyScanner::IsForbiddenModule("urllib.request"));
    assert(!SafetyScanner::IsForbiddenModule("osmosis"));
    std::cout << "[PASS] Safety scanner." << std::endl;

    // --- Fingerprints ---
    FingerprintGenerator fingerprints;
    assert(!fingerprints.generate({"Expr", "Call"}));
    auto shingles = fingerprints.generate({"Assign", "Name", "Constant", "Assign", "Name", "Constant"});
    assert(shingles);
    assert(shingles->size() == 3);
    assert(shingles->count("Assign-Name-Constant"));
    assert(shingles->count("Name-Constant-Assign"));
    assert(shingles->count("Constant-Assign-Name"));
    std::cout << "[PASS] Fingerprint shingles." << std::endl;

    // --- Fallback scorer: range and monotonicity ---
    FallbackScorer scorer;
    for (const char* source : {kBubbleSort, kBinarySearch, kFibonacci, "x = 1\n"}) {
        auto features = Extract(source);
        auto score = scorer.score(features, classifier.classify(features));
        assert(score.total == score.sum());
        assert(score.total >= 0 && score.total <= domain::ScoreBreakdown::kMaxTotal);
        assert(score.logic >= 0 && score.logic <= domain::ScoreBreakdown::kMaxLogic);
        assert(score.algorithm >= 0 && score.algorithm <= domain::ScoreBreakdown::kMaxAlgorithm);
        assert(score.style >= 0 && score.style <= domain::ScoreBreakdown::kMaxStyle);
        assert(score.optimization >= 0 && score.optimization <= domain::ScoreBreakdown::kMaxOptimization);
    }

    domain::FeatureRecord base;
    int previous = scorer.score(base, {}).algorithm;
    std::set<std::string> labels;
    for (const char* label : {"A", "B", "C", "D"}) {
        labels.insert(label);
        int current = scorer.score(base, labels).algorithm;
        assert(current >= previous);
        previous = current;
    }
    for (int loops = 0; loops < 20; ++loops) {
        domain::FeatureRecord busier = base;
        busier.loops = loops;
        domain::FeatureRecord busiest = busier;
        busiest.conditionals = 1;
        assert(scorer.score(busiest, {}).algorithm >= scorer.score(busier, {}).algorithm);
    }
    std::cout << "[PASS] Fallback scores stay in range and are monotone." << std::endl;

    // --- StaticAnalyzer end to end ---
    StaticAnalyzer analyzer(std::make_shared<infrastructure::PythonParser>());

    auto valid = analyzer.analyze({"bubble.py", kBubbleSort});
    assert(valid.valid);
    assert(valid.status == domain::GradeStatus::Pending);
    assert(valid.fingerprint && !valid.fingerprint->empty());
    assert(valid.fallbackScore);
    assert(valid.complexity == 4 && valid.maxLoopDepth == 2);
    assert(valid.summary.loops == 2 && valid.summary.functions == 1);

    // Re-analysis of the same unit gives the same result
    auto again = analyzer.analyze({"bubble.py", kBubbleSort});
    assert(again.algorithms == valid.algorithms);
    assert(*again.fingerprint == *valid.fingerprint);
    assert(again.fallbackScore->total == valid.fallbackScore->total);
    assert(Extract(kBubbleSort) == Extract(kBubbleSort));

    auto broken = analyzer.analyze({"broken.py", "def f(:\n    pass\n"});
    assert(!broken.valid);
    assert(broken.status == domain::GradeStatus::Fail);
    assert(broken.notes.size() == 1);
    assert(broken.notes[0].rfind("Syntax error at line 1: ", 0) == 0);
    assert(!broken.fingerprint);

    // Safety violations short-circuit: no features, fingerprint or score
    auto danger = analyzer.analyze({"danger.py", "import os\ndef f():\n    for i in range(3):\n        pass\n"});
    assert(!danger.valid);
    assert(danger.status == domain::GradeStatus::Flag);
    assert(danger.notes.size() == 2);
    assert(danger.notes[0] == "Security violation");
    assert(danger.notes[1] == "Forbidden import: os");
    assert(!danger.fingerprint && !danger.fallbackScore);
    assert(danger.algorithms.empty() && danger.complexity == 0);
    std::cout << "[PASS] StaticAnalyzer outcomes." << std::endl;

    // --- Deep nesting: invalid result instead of stack exhaustion ---
    for (int depth : {3000, 10000}) {
        const std::string source = "x = " + std::string(static_cast<size_t>(depth), '(') + "1" +
                                   std::string(static_cast<size_t>(depth), ')') + "\n";
        auto deep = analyzer.analyze({"deep.py", source});
        assert(!deep.valid);
        assert(deep.status == domain::GradeStatus::Fail);
        assert(deep.notes.size() == 1 && deep.notes[0].rfind("Syntax error at line 1: ", 0) == 0);
    }
    auto moderate = analyzer.analyze({"moderate.py", "x = " + std::string(100, '(') + "1" + std::string(100, ')') + "\n"});
    assert(moderate.valid);

    // Trees built by other parsers get the same bound from the walkers
    domain::SyntaxNode root(domain::NodeKind::Module, "", 1);
    domain::SyntaxNode* tip = &root;
    for (int i = 0; i < domain::kMaxSyntaxDepth + 50; ++i) {
        tip = tip->add(std::make_unique<domain::SyntaxNode>(domain::NodeKind::Expr, "", 1));
    }
    tip->add(std::make_unique<domain::SyntaxNode>(domain::NodeKind::Name, "eval", 1));
    assert(SafetyScanner().scan(root).empty());
    bool rejected = false;
    try {
        SyntaxFeatureExtractor().extract(root);
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Nesting depth bounded." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
