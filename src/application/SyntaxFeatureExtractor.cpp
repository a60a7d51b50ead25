/**
 * @file SyntaxFeatureExtractor.cpp
 * @brief Implementation of SyntaxFeatureExtractor.
 */

#include "application/SyntaxFeatureExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace codegrader::application {

namespace {

using domain::NodeKind;
using domain::SyntaxNode;

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool IsConstant(const SyntaxNode* node, const char* literal) {
    return node && node->kind == NodeKind::Constant && node->value == literal;
}

// x // 2 or x >> 1
bool IsHalving(const SyntaxNode& node) {
    if (node.kind != NodeKind::BinOp) return false;
    const SyntaxNode* op = node.child(1);
    const SyntaxNode* right = node.child(2);
    if (!op) return false;
    return (op->value == "FloorDiv" && IsConstant(right, "2")) ||
           (op->value == "RShift" && IsConstant(right, "1"));
}

// Pre-order search with an explicit stack.
template <typename Predicate>
bool AnyNode(const SyntaxNode& root, Predicate matches) {
    std::vector<const SyntaxNode*> pending{&root};
    while (!pending.empty()) {
        const SyntaxNode* node = pending.back();
        pending.pop_back();
        if (matches(*node)) return true;
        for (const auto& child : node->children) pending.push_back(child.get());
    }
    return false;
}

bool ContainsHalving(const SyntaxNode& node) {
    return AnyNode(node, IsHalving);
}

bool CallsByName(const SyntaxNode& node, const std::string& name) {
    return AnyNode(node, [&name](const SyntaxNode& candidate) {
        if (candidate.kind != NodeKind::Call) return false;
        const SyntaxNode* callee = candidate.child(0);
        return callee && callee->kind == NodeKind::Name && callee->value == name;
    });
}

bool MentionsCollections(const std::string& module) {
    return module.find("collections") != std::string::npos;
}

class FeatureWalker {
public:
    explicit FeatureWalker(domain::FeatureRecord& out) : m_out(out) {}

    void visit(const SyntaxNode& node) {
        DepthGuard guard(m_depth);
        if (node.kind != NodeKind::Module) {
            m_out.nodeTokens.emplace_back(node.kind == NodeKind::Operator ? node.value
                                                                          : domain::NodeKindName(node.kind));
        }

        switch (node.kind) {
            case NodeKind::For:
            case NodeKind::AsyncFor:
                enterLoop();
                visitChildren(node);
                --m_loopDepth;
                return;

            case NodeKind::While:
                enterLoop();
                if (ContainsHalving(node)) m_out.hints.halving = true;
                visitChildren(node);
                --m_loopDepth;
                return;

            case NodeKind::If:
                ++m_out.conditionals;
                break;

            case NodeKind::FunctionDef:
            case NodeKind::AsyncFunctionDef:
                ++m_out.functionCount;
                m_out.functionNames.push_back(ToLower(node.value));
                if (CallsByName(node, node.value)) m_out.recursion = true;
                break;

            case NodeKind::ClassDef:
                m_out.classDefined = true;
                m_out.referencedNames.push_back(ToLower(node.value));
                break;

            case NodeKind::Import:
                for (const auto& alias : node.children) {
                    m_out.imports.insert(alias->value);
                    if (MentionsCollections(alias->value)) m_out.dataStructures.deque = true;
                }
                break;

            case NodeKind::ImportFrom:
                if (!node.value.empty()) {
                    m_out.imports.insert(node.value);
                    if (MentionsCollections(node.value)) m_out.dataStructures.deque = true;
                }
                break;

            case NodeKind::Assign:
                visitAssign(node);
                break;

            case NodeKind::Name:
                m_out.referencedNames.push_back(ToLower(node.value));
                break;

            case NodeKind::Call: {
                const SyntaxNode* callee = node.child(0);
                if (callee && (callee->kind == NodeKind::Name || callee->kind == NodeKind::Attribute)) {
                    m_out.referencedNames.push_back(ToLower(callee->value));
                }
                break;
            }

            case NodeKind::Subscript: {
                const SyntaxNode* target = node.child(0);
                if (target && target->kind == NodeKind::Subscript) m_out.hints.matrix = true;
                break;
            }

            case NodeKind::List:
            case NodeKind::ListComp:
                m_out.dataStructures.sequence = true;
                break;
            case NodeKind::Dict:
            case NodeKind::DictComp:
                m_out.dataStructures.mapping = true;
                break;
            case NodeKind::Set:
            case NodeKind::SetComp:
                m_out.dataStructures.set = true;
                break;
            case NodeKind::Tuple:
                m_out.dataStructures.pair = true;
                break;

            case NodeKind::Module:
            case NodeKind::Return:
            case NodeKind::Delete:
            case NodeKind::AugAssign:
            case NodeKind::AnnAssign:
            case NodeKind::With:
            case NodeKind::AsyncWith:
            case NodeKind::Raise:
            case NodeKind::Try:
            case NodeKind::ExceptHandler:
            case NodeKind::Assert:
            case NodeKind::Alias:
            case NodeKind::Global:
            case NodeKind::Nonlocal:
            case NodeKind::Expr:
            case NodeKind::Pass:
            case NodeKind::Break:
            case NodeKind::Continue:
            case NodeKind::Arguments:
            case NodeKind::Arg:
            case NodeKind::Keyword:
            case NodeKind::WithItem:
            case NodeKind::Comprehension:
            case NodeKind::BoolOp:
            case NodeKind::NamedExpr:
            case NodeKind::BinOp:
            case NodeKind::UnaryOp:
            case NodeKind::Lambda:
            case NodeKind::IfExp:
            case NodeKind::GeneratorExp:
            case NodeKind::Await:
            case NodeKind::Yield:
            case NodeKind::YieldFrom:
            case NodeKind::Compare:
            case NodeKind::Constant:
            case NodeKind::JoinedStr:
            case NodeKind::Attribute:
            case NodeKind::Starred:
            case NodeKind::Slice:
            case NodeKind::Operator:
            case NodeKind::Match:
            case NodeKind::MatchCase:
            case NodeKind::Pattern:
                break;
        }
        visitChildren(node);
    }

private:
    class DepthGuard {
    public:
        explicit DepthGuard(int& depth) : m_depth(depth) {
            if (++m_depth > domain::kMaxSyntaxDepth) {
                --m_depth;
                throw std::runtime_error("syntax tree nested too deeply");
            }
        }
        ~DepthGuard() { --m_depth; }

    private:
        int& m_depth;
    };

    void visitChildren(const SyntaxNode& node) {
        for (const auto& child : node.children) visit(*child);
    }

    void enterLoop() {
        ++m_out.loops;
        ++m_loopDepth;
        m_out.maxLoopDepth = std::max(m_out.maxLoopDepth, m_loopDepth);
        if (m_loopDepth > 1) m_out.nestedLoops = true;
    }

    // Targets are every child but the last; the last child is the assigned value.
    void visitAssign(const SyntaxNode& node) {
        if (node.children.size() < 2) return;
        const SyntaxNode& firstTarget = *node.children.front();
        const SyntaxNode& value = *node.children.back();
        if (firstTarget.kind == NodeKind::Tuple && firstTarget.children.size() == 2 &&
            value.kind == NodeKind::Tuple) {
            m_out.hints.swap = true;
        }

        for (size_t i = 0; i + 1 < node.children.size(); ++i) {
            const SyntaxNode& target = *node.children[i];
            if (target.kind != NodeKind::Name) continue;
            std::string name = ToLower(target.value);
            if (name.find("dp") != std::string::npos || name.find("memo") != std::string::npos ||
                name.find("cache") != std::string::npos || name.find("table") != std::string::npos) {
                m_out.hints.memo = true;
            }
            m_out.referencedNames.push_back(std::move(name));
        }
    }

    domain::FeatureRecord& m_out;
    int m_loopDepth = 0;
    int m_depth = 0;
};

} // namespace

domain::FeatureRecord SyntaxFeatureExtractor::extract(const domain::SyntaxNode& root) const {
    domain::FeatureRecord record;
    FeatureWalker walker(record);
    walker.visit(root);
    return record;
}

} // namespace codegrader::application
