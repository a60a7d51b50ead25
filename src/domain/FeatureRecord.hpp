/**
 * @file FeatureRecord.hpp
 * @brief Structural features extracted from one source unit.
 */

#pragma once
#include <set>
#include <string>
#include <vector>

namespace codegrader::domain {

/**
 * @struct DataStructureUsage
 * @brief Which built-in collection kinds appear in the code.
 */
struct DataStructureUsage {
    bool sequence = false; ///< list literal or list comprehension
    bool mapping = false;  ///< dict literal or dict comprehension
    bool set = false;      ///< set literal or set comprehension
    bool pair = false;     ///< tuple
    bool deque = false;    ///< collections import

    bool any() const { return sequence || mapping || set || pair || deque; }
};

/**
 * @struct AlgorithmHints
 * @brief Syntactic patterns that suggest a specific technique.
 */
struct AlgorithmHints {
    bool swap = false;    ///< a, b = b, a
    bool halving = false; ///< // 2 or >> 1 inside a while loop
    bool memo = false;    ///< dp / memo / cache / table assignment targets
    bool matrix = false;  ///< x[i][j]
};

/**
 * @struct FeatureRecord
 * @brief Output of a single pre-order walk. Immutable once produced.
 */
struct FeatureRecord {
    int loops = 0;
    int conditionals = 0;
    int functionCount = 0;
    int maxLoopDepth = 0;
    bool nestedLoops = false;
    bool recursion = false;
    bool classDefined = false;

    DataStructureUsage dataStructures;
    AlgorithmHints hints;

    std::vector<std::string> functionNames;   ///< lowercased, visit order
    std::vector<std::string> referencedNames; ///< lowercased, visit order
    std::set<std::string> imports;

    /// Node-type tokens for fingerprinting only. Never leaves the analyzer.
    std::vector<std::string> nodeTokens;

    /** @brief Cyclomatic complexity by decision-point tally. */
    int complexity() const { return 1 + loops + conditionals; }

    bool operator==(const FeatureRecord& other) const {
        return loops == other.loops && conditionals == other.conditionals &&
               functionCount == other.functionCount && maxLoopDepth == other.maxLoopDepth &&
               nestedLoops == other.nestedLoops && recursion == other.recursion &&
               classDefined == other.classDefined &&
               dataStructures.sequence == other.dataStructures.sequence &&
               dataStructures.mapping == other.dataStructures.mapping &&
               dataStructures.set == other.dataStructures.set &&
               dataStructures.pair == other.dataStructures.pair &&
               dataStructures.deque == other.dataStructures.deque &&
               hints.swap == other.hints.swap && hints.halving == other.hints.halving &&
               hints.memo == other.hints.memo && hints.matrix == other.hints.matrix &&
               functionNames == other.functionNames && referencedNames == other.referencedNames &&
               imports == other.imports && nodeTokens == other.nodeTokens;
    }
};

} // namespace codegrader::domain
