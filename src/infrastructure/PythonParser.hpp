/**
 * @file PythonParser.hpp
 * @brief SourceParser backed by tree-sitter and its Python grammar.
 */

#pragma once

#include "domain/SyntaxTree.hpp"

namespace codegrader::infrastructure {

/**
 * @class PythonParser
 * @brief Parses with tree-sitter-python and lowers the concrete tree onto NodeKind.
 *
 * The lowering follows Python's own AST: elif chains become nested If nodes,
 * chained assignments share one Assign, boolean chains flatten into one BoolOp
 * and parentheses disappear. Any ERROR or MISSING node in the concrete tree is
 * reported as a ParseError on its line.
 *
 * A TSParser is created per call, so one instance can be shared by worker threads.
 */
class PythonParser : public domain::SourceParser {
public:
    std::unique_ptr<domain::SyntaxNode> parse(const std::string& source) const override;
};

} // namespace codegrader::infrastructure
