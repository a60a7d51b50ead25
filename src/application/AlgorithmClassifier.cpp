/**
 * @file AlgorithmClassifier.cpp
 * @brief Implementation of AlgorithmClassifier.
 */

#include "application/AlgorithmClassifier.hpp"
#include <utility>
#include <vector>

namespace codegrader::application {

namespace {
    // keyword (substring of the joined names) -> label
    const std::vector<std::pair<std::string, std::string>> kNameKeywords = {
        {"binary_search", "Binary Search"},
        {"binarysearch", "Binary Search"},
        {"quick_sort", "Quick Sort"},
        {"quicksort", "Quick Sort"},
        {"merge_sort", "Merge Sort"},
        {"mergesort", "Merge Sort"},
        {"bubble_sort", "Bubble Sort"},
        {"bubblesort", "Bubble Sort"},
        {"insertion_sort", "Insertion Sort"},
        {"insertionsort", "Insertion Sort"},
        {"selection_sort", "Selection Sort"},
        {"selectionsort", "Selection Sort"},
        {"heap_sort", "Heap Sort"},
        {"heapsort", "Heap Sort"},
        {"factorial", "Math/Factorial"},
        {"fibonacci", "Dynamic Programming / Fibonacci"},
        {"dfs", "Depth-First Search"},
        {"bfs", "Breadth-First Search"},
        {"dijkstra", "Dijkstra's Algorithm"},
        {"linkedlist", "Linked List"},
        {"linked_list", "Linked List"},
        {"stack", "Stack"},
        {"queue", "Queue"},
        {"tree", "Tree Structure"},
        {"graph", "Graph Structure"},
        {"hash_map", "Hash Map"},
        {"hashmap", "Hash Map"},
    };
}

std::set<std::string> AlgorithmClassifier::classify(const domain::FeatureRecord& features) const {
    std::set<std::string> labels;

    if (features.recursion) labels.insert("Recursion");
    if (features.nestedLoops) {
        labels.insert("Nested Loops");
    } else if (features.loops > 0) {
        labels.insert("Iterative Logic");
    }
    if (features.hints.halving) labels.insert("Binary Search");
    if (features.hints.memo) labels.insert("Dynamic Programming");
    if (features.hints.matrix) labels.insert("Matrix Operations");
    if (features.hints.swap) labels.insert("Swap Pattern");

    std::string allNames;
    for (const auto& name : features.functionNames) allNames += name + " ";
    for (const auto& name : features.referencedNames) allNames += name + " ";

    for (const auto& [keyword, label] : kNameKeywords) {
        if (allNames.find(keyword) != std::string::npos) labels.insert(label);
    }

    if (allNames.find("append") != std::string::npos && allNames.find("pop") != std::string::npos &&
        !labels.count("Stack") && !labels.count("Queue")) {
        labels.insert("Stack/Queue Operations");
    }
    return labels;
}

} // namespace codegrader::application
