/**
 * @file SyntaxTree.hpp
 * @brief Closed node model for parsed Python sources.
 *
 * Node kinds mirror the class names of Python's own AST so that fingerprints
 * built from node-type tokens read the same as the ones a CPython-based
 * grader would produce. Children are stored in Python's AST field order.
 */

#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace codegrader::domain {

/**
 * @enum NodeKind
 * @brief Every syntax node kind the parser can emit.
 */
enum class NodeKind {
    Module,
    // Statements
    FunctionDef,
    AsyncFunctionDef,
    ClassDef,
    Return,
    Delete,
    Assign,
    AugAssign,
    AnnAssign,
    For,
    AsyncFor,
    While,
    If,
    With,
    AsyncWith,
    Raise,
    Try,
    ExceptHandler,
    Assert,
    Import,
    ImportFrom,
    Alias,
    Global,
    Nonlocal,
    Expr,
    Pass,
    Break,
    Continue,
    Match,
    // Helpers
    Arguments,
    Arg,
    Keyword,
    WithItem,
    Comprehension,
    MatchCase,
    Pattern, ///< One case pattern; children are its literal, name and sub-pattern parts.
    // Expressions
    BoolOp,
    NamedExpr,
    BinOp,
    UnaryOp,
    Lambda,
    IfExp,
    Dict,
    Set,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Await,
    Yield,
    YieldFrom,
    Compare,
    Call,
    Constant,
    JoinedStr,
    Attribute,
    Subscript,
    Starred,
    Name,
    List,
    Tuple,
    Slice,
    Operator ///< value holds the Python operator class name ("Add", "FloorDiv", "Lt"...).
};

/**
 * @struct SyntaxNode
 * @brief One node of the parsed tree.
 *
 * `value` carries the identifier for Name/FunctionDef/ClassDef/Attribute/Arg/Keyword,
 * the dotted module for Import aliases and ImportFrom, the literal text for Constant
 * and the operator name for Operator nodes.
 */
struct SyntaxNode {
    NodeKind kind = NodeKind::Module;
    std::string value;
    int line = 0;
    std::vector<std::unique_ptr<SyntaxNode>> children;

    SyntaxNode() = default;
    SyntaxNode(NodeKind k, std::string v, int ln) : kind(k), value(std::move(v)), line(ln) {}

    /** @brief Appends a child and returns a raw pointer to it. */
    SyntaxNode* add(std::unique_ptr<SyntaxNode> child) {
        children.push_back(std::move(child));
        return children.back().get();
    }

    const SyntaxNode* child(size_t index) const {
        return index < children.size() ? children[index].get() : nullptr;
    }
};

/** @brief Python AST class name for a node kind (used as fingerprint token). */
inline const char* NodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Module: return "Module";
        case NodeKind::FunctionDef: return "FunctionDef";
        case NodeKind::AsyncFunctionDef: return "AsyncFunctionDef";
        case NodeKind::ClassDef: return "ClassDef";
        case NodeKind::Return: return "Return";
        case NodeKind::Delete: return "Delete";
        case NodeKind::Assign: return "Assign";
        case NodeKind::AugAssign: return "AugAssign";
        case NodeKind::AnnAssign: return "AnnAssign";
        case NodeKind::For: return "For";
        case NodeKind::AsyncFor: return "AsyncFor";
        case NodeKind::While: return "While";
        case NodeKind::If: return "If";
        case NodeKind::With: return "With";
        case NodeKind::AsyncWith: return "AsyncWith";
        case NodeKind::Raise: return "Raise";
        case NodeKind::Try: return "Try";
        case NodeKind::ExceptHandler: return "ExceptHandler";
        case NodeKind::Assert: return "Assert";
        case NodeKind::Import: return "Import";
        case NodeKind::ImportFrom: return "ImportFrom";
        case NodeKind::Alias: return "alias";
        case NodeKind::Global: return "Global";
        case NodeKind::Nonlocal: return "Nonlocal";
        case NodeKind::Expr: return "Expr";
        case NodeKind::Pass: return "Pass";
        case NodeKind::Break: return "Break";
        case NodeKind::Continue: return "Continue";
        case NodeKind::Match: return "Match";
        case NodeKind::Arguments: return "arguments";
        case NodeKind::Arg: return "arg";
        case NodeKind::Keyword: return "keyword";
        case NodeKind::WithItem: return "withitem";
        case NodeKind::Comprehension: return "comprehension";
        case NodeKind::MatchCase: return "match_case";
        case NodeKind::Pattern: return "pattern";
        case NodeKind::BoolOp: return "BoolOp";
        case NodeKind::NamedExpr: return "NamedExpr";
        case NodeKind::BinOp: return "BinOp";
        case NodeKind::UnaryOp: return "UnaryOp";
        case NodeKind::Lambda: return "Lambda";
        case NodeKind::IfExp: return "IfExp";
        case NodeKind::Dict: return "Dict";
        case NodeKind::Set: return "Set";
        case NodeKind::ListComp: return "ListComp";
        case NodeKind::SetComp: return "SetComp";
        case NodeKind::DictComp: return "DictComp";
        case NodeKind::GeneratorExp: return "GeneratorExp";
        case NodeKind::Await: return "Await";
        case NodeKind::Yield: return "Yield";
        case NodeKind::YieldFrom: return "YieldFrom";
        case NodeKind::Compare: return "Compare";
        case NodeKind::Call: return "Call";
        case NodeKind::Constant: return "Constant";
        case NodeKind::JoinedStr: return "JoinedStr";
        case NodeKind::Attribute: return "Attribute";
        case NodeKind::Subscript: return "Subscript";
        case NodeKind::Starred: return "Starred";
        case NodeKind::Name: return "Name";
        case NodeKind::List: return "List";
        case NodeKind::Tuple: return "Tuple";
        case NodeKind::Slice: return "Slice";
        case NodeKind::Operator: return "Operator";
    }
    return "Unknown";
}

/// Deepest tree a SourceParser returns. Tree walkers recurse and rely on this bound.
constexpr int kMaxSyntaxDepth = 1000;

/**
 * @class ParseError
 * @brief Raised by a SourceParser on malformed source.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(int line, const std::string& message)
        : std::runtime_error(message), m_line(line) {}

    int line() const { return m_line; }

private:
    int m_line;
};

/**
 * @class SourceParser
 * @brief Abstract interface for turning source text into a syntax tree.
 */
class SourceParser {
public:
    virtual ~SourceParser() = default;

    /**
     * @brief Parses a complete source file.
     * @param source Source text.
     * @return Root node of kind Module.
     * @throws ParseError on malformed source or nesting deeper than kMaxSyntaxDepth.
     */
    virtual std::unique_ptr<SyntaxNode> parse(const std::string& source) const = 0;
};

} // namespace codegrader::domain
