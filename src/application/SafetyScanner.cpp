/**
 * @file SafetyScanner.cpp
 * @brief Implementation of SafetyScanner.
 */

#include "application/SafetyScanner.hpp"
#include <set>

namespace codegrader::application {

namespace {
    const std::set<std::string> kForbiddenModules = {
        "os", "sys", "subprocess", "shutil", "socket", "requests", "pickle", "urllib", "ctypes"};

    const std::set<std::string> kForbiddenCalls = {"exec", "eval", "compile", "open", "__import__"};
}

bool SafetyScanner::IsForbiddenModule(const std::string& dottedName) {
    return kForbiddenModules.count(dottedName.substr(0, dottedName.find('.'))) > 0;
}

bool SafetyScanner::IsForbiddenCall(const std::string& name) {
    return kForbiddenCalls.count(name) > 0;
}

std::vector<std::string> SafetyScanner::scan(const domain::SyntaxNode& root) const {
    using domain::NodeKind;

    std::vector<std::string> violations;
    std::vector<const domain::SyntaxNode*> pending{&root};
    while (!pending.empty()) {
        const domain::SyntaxNode& node = *pending.back();
        pending.pop_back();

        if (node.kind == NodeKind::Import) {
            for (const auto& alias : node.children) {
                if (IsForbiddenModule(alias->value)) {
                    violations.push_back("Forbidden import: " + alias->value);
                }
            }
        } else if (node.kind == NodeKind::ImportFrom) {
            if (!node.value.empty() && IsForbiddenModule(node.value)) {
                violations.push_back("Forbidden module import: " + node.value);
            }
        } else if (node.kind == NodeKind::Call) {
            const domain::SyntaxNode* callee = node.child(0);
            if (callee && callee->kind == NodeKind::Name && IsForbiddenCall(callee->value)) {
                violations.push_back("Unsafe call: " + callee->value + "()");
            }
        }

        // reversed so the first child is visited next (pre-order)
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            pending.push_back(it->get());
        }
    }
    return violations;
}

} // namespace codegrader::application
