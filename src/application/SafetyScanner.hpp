/**
 * @file SafetyScanner.hpp
 * @brief Deny-list check for imports and calls that reach outside the sandbox.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SyntaxTree.hpp"

namespace codegrader::application {

/**
 * @class SafetyScanner
 * @brief Walks a parsed tree and reports every forbidden import or call.
 *
 * The walk uses an explicit stack, so tree depth is limited by memory only.
 */
class SafetyScanner {
public:
    /**
     * @brief Scans the whole tree.
     * @return One message per violation, in visit order. Empty when safe.
     */
    std::vector<std::string> scan(const domain::SyntaxNode& root) const;

    static bool IsForbiddenModule(const std::string& dottedName);
    static bool IsForbiddenCall(const std::string& name);
};

} // namespace codegrader::application
