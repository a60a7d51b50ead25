/**
 * @file PythonParser.cpp
 * @brief Implementation of PythonParser.
 */

#include "infrastructure/PythonParser.hpp"
#include <tree_sitter/api.h>
#include <cstring>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

extern "C" const TSLanguage* tree_sitter_python(void);

namespace codegrader::infrastructure {

namespace {

using domain::NodeKind;
using domain::ParseError;
using domain::SyntaxNode;
using NodePtr = std::unique_ptr<SyntaxNode>;

struct ParserDeleter {
    void operator()(TSParser* parser) const { ts_parser_delete(parser); }
};

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};

class CursorGuard {
public:
    explicit CursorGuard(TSNode node) : m_cursor(ts_tree_cursor_new(node)) {}
    ~CursorGuard() { ts_tree_cursor_delete(&m_cursor); }

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

    TSTreeCursor* get() { return &m_cursor; }

private:
    TSTreeCursor m_cursor;
};

const std::map<std::string, std::string> kBinaryOperators = {
    {"+", "Add"}, {"-", "Sub"}, {"*", "Mult"}, {"@", "MatMult"}, {"/", "Div"}, {"%", "Mod"},
    {"//", "FloorDiv"}, {"**", "Pow"}, {"|", "BitOr"}, {"&", "BitAnd"}, {"^", "BitXor"},
    {"<<", "LShift"}, {">>", "RShift"}};

const std::map<std::string, std::string> kComparisonOperators = {
    {"<", "Lt"}, {"<=", "LtE"}, {"==", "Eq"}, {"!=", "NotEq"}, {"<>", "NotEq"}, {">=", "GtE"},
    {">", "Gt"}, {"in", "In"}, {"not in", "NotIn"}, {"is", "Is"}, {"is not", "IsNot"}};

const std::map<std::string, std::string> kUnaryOperators = {{"+", "UAdd"}, {"-", "USub"}, {"~", "Invert"}};

NodePtr Make(NodeKind kind, int line, std::string value = "") {
    return std::make_unique<SyntaxNode>(kind, std::move(value), line);
}

int LineOf(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

bool Is(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

struct TreeProblem {
    int line;
    std::string message;
};

// Pre-order walk with a cursor: first ERROR/MISSING node, or the first node past the depth limit.
std::optional<TreeProblem> FindProblem(TSNode root) {
    CursorGuard guard(root);
    TSTreeCursor* cursor = guard.get();
    int depth = 0;
    while (true) {
        TSNode node = ts_tree_cursor_current_node(cursor);
        if (ts_node_is_missing(node)) {
            return TreeProblem{LineOf(node), std::string("expected '") + ts_node_type(node) + "'"};
        }
        if (Is(node, "ERROR")) {
            return TreeProblem{LineOf(node), "invalid syntax"};
        }
        if (depth > domain::kMaxSyntaxDepth) {
            return TreeProblem{LineOf(node), "too many nested levels"};
        }

        if (ts_tree_cursor_goto_first_child(cursor)) {
            ++depth;
            continue;
        }
        while (!ts_tree_cursor_goto_next_sibling(cursor)) {
            if (!ts_tree_cursor_goto_parent(cursor)) return std::nullopt;
            --depth;
        }
    }
}

/// Lowers an error-free concrete tree. Recursion follows the tree, whose depth FindProblem bounds.
class Lowering {
public:
    explicit Lowering(const std::string& source) : m_source(source) {}

    NodePtr module(TSNode root) {
        auto module = Make(NodeKind::Module, 1);
        addStatements(*module, root);
        return module;
    }

private:
    // --- tree access --------------------------------------------------------

    std::string text(TSNode node) const {
        const uint32_t start = ts_node_start_byte(node);
        return m_source.substr(start, ts_node_end_byte(node) - start);
    }

    static std::vector<TSNode> Named(TSNode node) {
        std::vector<TSNode> children;
        const uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (!ts_node_is_extra(child)) children.push_back(child);
        }
        return children;
    }

    static TSNode Field(TSNode node, const char* name) {
        return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
    }

    static TSNode Require(TSNode node, const char* name) {
        TSNode child = Field(node, name);
        if (ts_node_is_null(child)) throw ParseError(LineOf(node), "invalid syntax");
        return child;
    }

    static bool HasToken(TSNode node, const char* token) {
        const uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (!ts_node_is_named(child) && Is(child, token)) return true;
        }
        return false;
    }

    // --- statements ---------------------------------------------------------

    void addStatements(SyntaxNode& parent, TSNode container) {
        for (TSNode child : Named(container)) addStatement(parent, child);
    }

    void addStatement(SyntaxNode& parent, TSNode node) {
        const std::string type = ts_node_type(node);
        const int line = LineOf(node);

        if (type == "expression_statement") { parent.add(expressionStatement(node)); return; }
        if (type == "if_statement") { parent.add(ifStatement(node)); return; }
        if (type == "for_statement") { parent.add(forStatement(node)); return; }
        if (type == "while_statement") { parent.add(whileStatement(node)); return; }
        if (type == "try_statement") { parent.add(tryStatement(node)); return; }
        if (type == "with_statement") { parent.add(withStatement(node)); return; }
        if (type == "function_definition") { parent.add(functionDef(node, {})); return; }
        if (type == "class_definition") { parent.add(classDef(node, {})); return; }
        if (type == "decorated_definition") { parent.add(decorated(node)); return; }
        if (type == "match_statement") { parent.add(matchStatement(node)); return; }
        if (type == "import_statement") { parent.add(importStatement(node)); return; }
        if (type == "import_from_statement" || type == "future_import_statement") {
            parent.add(importFrom(node));
            return;
        }
        if (type == "block") { addStatements(parent, node); return; }

        if (type == "pass_statement") { parent.add(Make(NodeKind::Pass, line)); return; }
        if (type == "break_statement") { parent.add(Make(NodeKind::Break, line)); return; }
        if (type == "continue_statement") { parent.add(Make(NodeKind::Continue, line)); return; }
        if (type == "return_statement") { parent.add(withOperands(NodeKind::Return, node)); return; }
        if (type == "raise_statement") { parent.add(withOperands(NodeKind::Raise, node)); return; }
        if (type == "assert_statement") { parent.add(withOperands(NodeKind::Assert, node)); return; }
        if (type == "delete_statement") { parent.add(deleteStatement(node)); return; }
        if (type == "global_statement" || type == "nonlocal_statement") {
            std::string names;
            for (TSNode name : Named(node)) {
                if (!names.empty()) names += ",";
                names += text(name);
            }
            parent.add(Make(type == "global_statement" ? NodeKind::Global : NodeKind::Nonlocal, line, names));
            return;
        }
        if (type == "print_statement" || type == "exec_statement") {
            const std::string keyword = type == "print_statement" ? "print" : "exec";
            throw ParseError(line, "Missing parentheses in call to '" + keyword + "'");
        }

        // type aliases and grammar additions: keep their expressions
        parent.add(withOperands(NodeKind::Expr, node));
    }

    NodePtr withOperands(NodeKind kind, TSNode node) {
        auto result = Make(kind, LineOf(node));
        for (TSNode child : Named(node)) result->add(expr(child));
        return result;
    }

    NodePtr expressionStatement(TSNode node) {
        auto children = Named(node);
        if (children.size() == 1) {
            if (Is(children[0], "assignment")) return assignment(children[0]);
            if (Is(children[0], "augmented_assignment")) return augmentedAssignment(children[0]);
        }
        auto statement = Make(NodeKind::Expr, LineOf(node));
        statement->add(children.size() == 1 ? expr(children[0]) : sequence(NodeKind::Tuple, node));
        return statement;
    }

    NodePtr assignment(TSNode node) {
        const int line = LineOf(node);
        TSNode annotation = Field(node, "type");
        if (!ts_node_is_null(annotation)) {
            auto annotated = Make(NodeKind::AnnAssign, line);
            annotated->add(expr(Require(node, "left")));
            annotated->add(expr(annotation));
            TSNode value = Field(node, "right");
            if (!ts_node_is_null(value)) annotated->add(expr(value));
            return annotated;
        }

        // a = b = 1 nests on the right; Python keeps one node with every target
        auto assign = Make(NodeKind::Assign, line);
        assign->add(expr(Require(node, "left")));
        TSNode value = Require(node, "right");
        while (Is(value, "assignment") && ts_node_is_null(Field(value, "type"))) {
            assign->add(expr(Require(value, "left")));
            value = Require(value, "right");
        }
        assign->add(expr(value));
        return assign;
    }

    NodePtr augmentedAssignment(TSNode node) {
        const int line = LineOf(node);
        std::string op = text(Require(node, "operator"));
        op.pop_back(); // trailing '='
        auto it = kBinaryOperators.find(op);
        if (it == kBinaryOperators.end()) throw ParseError(line, "invalid syntax");

        auto aug = Make(NodeKind::AugAssign, line);
        aug->add(expr(Require(node, "left")));
        aug->add(Make(NodeKind::Operator, line, it->second));
        aug->add(expr(Require(node, "right")));
        return aug;
    }

    NodePtr ifStatement(TSNode node) {
        auto root = Make(NodeKind::If, LineOf(node));
        root->add(expr(Require(node, "condition")));
        addStatements(*root, Require(node, "consequence"));

        SyntaxNode* current = root.get();
        for (TSNode clause : Named(node)) {
            if (Is(clause, "elif_clause")) {
                auto elif = Make(NodeKind::If, LineOf(clause));
                elif->add(expr(Require(clause, "condition")));
                addStatements(*elif, Require(clause, "consequence"));
                current = current->add(std::move(elif));
            } else if (Is(clause, "else_clause")) {
                addStatements(*current, Require(clause, "body"));
            }
        }
        return root;
    }

    void addElse(SyntaxNode& target, TSNode node) {
        TSNode alternative = Field(node, "alternative");
        if (!ts_node_is_null(alternative)) addStatements(target, Require(alternative, "body"));
    }

    NodePtr whileStatement(TSNode node) {
        auto loop = Make(NodeKind::While, LineOf(node));
        loop->add(expr(Require(node, "condition")));
        addStatements(*loop, Require(node, "body"));
        addElse(*loop, node);
        return loop;
    }

    NodePtr forStatement(TSNode node) {
        auto loop = Make(HasToken(node, "async") ? NodeKind::AsyncFor : NodeKind::For, LineOf(node));
        loop->add(expr(Require(node, "left")));
        loop->add(expr(Require(node, "right")));
        addStatements(*loop, Require(node, "body"));
        addElse(*loop, node);
        return loop;
    }

    NodePtr tryStatement(TSNode node) {
        auto statement = Make(NodeKind::Try, LineOf(node));
        addStatements(*statement, Require(node, "body"));
        for (TSNode clause : Named(node)) {
            if (Is(clause, "except_clause") || Is(clause, "except_group_clause")) {
                statement->add(exceptHandler(clause));
            } else if (Is(clause, "else_clause")) {
                addStatements(*statement, Require(clause, "body"));
            } else if (Is(clause, "finally_clause")) {
                for (TSNode block : Named(clause)) addStatements(*statement, block);
            }
        }
        return statement;
    }

    // except E as name: the handler keeps E as child and the bound name as value
    NodePtr exceptHandler(TSNode clause) {
        auto handler = Make(NodeKind::ExceptHandler, LineOf(clause));
        bool sawAs = false;
        const uint32_t count = ts_node_child_count(clause);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(clause, i);
            if (!ts_node_is_named(child)) {
                if (Is(child, "as")) sawAs = true;
                continue;
            }
            if (ts_node_is_extra(child)) continue;

            if (Is(child, "block")) {
                addStatements(*handler, child);
            } else if (Is(child, "as_pattern")) {
                auto parts = Named(child);
                handler->add(expr(parts.front()));
                if (parts.size() > 1) handler->value = text(parts.back());
            } else if (sawAs) {
                handler->value = text(child);
            } else {
                handler->add(expr(child));
            }
        }
        return handler;
    }

    NodePtr withStatement(TSNode node) {
        auto statement = Make(HasToken(node, "async") ? NodeKind::AsyncWith : NodeKind::With, LineOf(node));
        for (TSNode child : Named(node)) {
            if (!Is(child, "with_clause")) continue;
            for (TSNode item : Named(child)) {
                if (Is(item, "with_item")) statement->add(withItem(item));
            }
        }
        addStatements(*statement, Require(node, "body"));
        return statement;
    }

    NodePtr withItem(TSNode item) {
        auto result = Make(NodeKind::WithItem, LineOf(item));
        TSNode value = Require(item, "value");
        if (Is(value, "as_pattern")) {
            for (TSNode part : Named(value)) result->add(expr(part));
            return result;
        }
        result->add(expr(value));
        TSNode alias = Field(item, "alias");
        if (!ts_node_is_null(alias)) result->add(expr(alias));
        return result;
    }

    NodePtr decorated(TSNode node) {
        std::vector<NodePtr> decorators;
        for (TSNode child : Named(node)) {
            if (!Is(child, "decorator")) continue;
            auto parts = Named(child);
            if (!parts.empty()) decorators.push_back(expr(parts.front()));
        }
        TSNode definition = Require(node, "definition");
        if (Is(definition, "class_definition")) return classDef(definition, std::move(decorators));
        return functionDef(definition, std::move(decorators));
    }

    NodePtr functionDef(TSNode node, std::vector<NodePtr> decorators) {
        const NodeKind kind = HasToken(node, "async") ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef;
        auto function = Make(kind, LineOf(node), text(Require(node, "name")));
        function->add(arguments(Field(node, "parameters"), LineOf(node)));
        addStatements(*function, Require(node, "body"));
        for (auto& decorator : decorators) function->add(std::move(decorator));
        TSNode returns = Field(node, "return_type");
        if (!ts_node_is_null(returns)) function->add(expr(returns));
        return function;
    }

    NodePtr classDef(TSNode node, std::vector<NodePtr> decorators) {
        auto cls = Make(NodeKind::ClassDef, LineOf(node), text(Require(node, "name")));
        TSNode bases = Field(node, "superclasses");
        if (!ts_node_is_null(bases)) addCallArguments(*cls, bases);
        addStatements(*cls, Require(node, "body"));
        for (auto& decorator : decorators) cls->add(std::move(decorator));
        return cls;
    }

    std::string parameterName(TSNode node) const {
        if (Is(node, "identifier")) return text(node);
        for (TSNode child : Named(node)) {
            if (Is(child, "identifier")) return text(child);
        }
        return text(node);
    }

    /// Parameters in order, then their default values, as in ast.arguments.
    NodePtr arguments(TSNode params, int line) {
        auto args = Make(NodeKind::Arguments, ts_node_is_null(params) ? line : LineOf(params));
        if (ts_node_is_null(params)) return args;

        std::vector<NodePtr> defaults;
        for (TSNode param : Named(params)) {
            const int paramLine = LineOf(param);
            if (Is(param, "identifier") || Is(param, "list_splat_pattern") || Is(param, "dictionary_splat_pattern")) {
                args->add(Make(NodeKind::Arg, paramLine, parameterName(param)));
            } else if (Is(param, "typed_parameter")) {
                auto parts = Named(param);
                auto arg = Make(NodeKind::Arg, paramLine, parameterName(parts.front()));
                arg->add(expr(Require(param, "type")));
                args->add(std::move(arg));
            } else if (Is(param, "default_parameter") || Is(param, "typed_default_parameter")) {
                auto arg = Make(NodeKind::Arg, paramLine, text(Require(param, "name")));
                TSNode annotation = Field(param, "type");
                if (!ts_node_is_null(annotation)) arg->add(expr(annotation));
                args->add(std::move(arg));
                defaults.push_back(expr(Require(param, "value")));
            }
            // positional_separator and keyword_separator carry no name
        }
        for (auto& value : defaults) args->add(std::move(value));
        return args;
    }

    NodePtr importStatement(TSNode node) {
        auto statement = Make(NodeKind::Import, LineOf(node));
        for (TSNode name : Named(node)) statement->add(alias(name));
        return statement;
    }

    NodePtr alias(TSNode name) {
        if (Is(name, "aliased_import")) {
            return Make(NodeKind::Alias, LineOf(name), text(Require(name, "name")));
        }
        return Make(NodeKind::Alias, LineOf(name), Is(name, "wildcard_import") ? "*" : text(name));
    }

    NodePtr importFrom(TSNode node) {
        const int line = LineOf(node);
        std::string module = "__future__";
        TSNode moduleNode = Field(node, "module_name");
        if (!ts_node_is_null(moduleNode)) {
            module.clear();
            if (Is(moduleNode, "dotted_name")) {
                module = text(moduleNode);
            } else {
                // relative import: leading dots are dropped
                for (TSNode part : Named(moduleNode)) {
                    if (Is(part, "dotted_name")) module = text(part);
                }
            }
        }

        auto statement = Make(NodeKind::ImportFrom, line, module);
        for (TSNode child : Named(node)) {
            if (!ts_node_is_null(moduleNode) && ts_node_eq(child, moduleNode)) continue;
            statement->add(alias(child));
        }
        return statement;
    }

    NodePtr deleteStatement(TSNode node) {
        auto statement = Make(NodeKind::Delete, LineOf(node));
        for (TSNode target : Named(node)) {
            if (Is(target, "expression_list")) {
                for (TSNode item : Named(target)) statement->add(expr(item));
            } else {
                statement->add(expr(target));
            }
        }
        return statement;
    }

    NodePtr matchStatement(TSNode node) {
        auto match = Make(NodeKind::Match, LineOf(node));
        std::vector<TSNode> subjects;
        std::vector<TSNode> cases;
        for (TSNode child : Named(node)) {
            if (Is(child, "block")) {
                for (TSNode clause : Named(child)) cases.push_back(clause);
            } else if (Is(child, "case_clause")) {
                cases.push_back(child);
            } else {
                subjects.push_back(child);
            }
        }
        if (subjects.size() == 1) {
            match->add(expr(subjects.front()));
        } else {
            auto tuple = Make(NodeKind::Tuple, LineOf(node));
            for (TSNode subject : subjects) tuple->add(expr(subject));
            match->add(std::move(tuple));
        }

        for (TSNode clause : cases) {
            if (!Is(clause, "case_clause")) continue;
            auto matchCase = Make(NodeKind::MatchCase, LineOf(clause));
            for (TSNode part : Named(clause)) {
                if (Is(part, "case_pattern")) matchCase->add(pattern(part));
            }
            TSNode guard = Field(clause, "guard");
            if (!ts_node_is_null(guard)) {
                for (TSNode condition : Named(guard)) matchCase->add(expr(condition));
            }
            addStatements(*matchCase, Require(clause, "consequence"));
            match->add(std::move(matchCase));
        }
        return match;
    }

    NodePtr pattern(TSNode node) {
        const int line = LineOf(node);
        if (Is(node, "identifier") || Is(node, "dotted_name")) return Make(NodeKind::Name, line, text(node));
        if (Is(node, "string") || Is(node, "concatenated_string") || Is(node, "integer") || Is(node, "float") ||
            Is(node, "true") || Is(node, "false") || Is(node, "none") || Is(node, "unary_operator") ||
            Is(node, "binary_operator")) {
            return expr(node);
        }
        auto result = Make(NodeKind::Pattern, line);
        for (TSNode child : Named(node)) result->add(pattern(child));
        return result;
    }

    // --- expressions --------------------------------------------------------

    NodePtr expr(TSNode node) {
        const std::string type = ts_node_type(node);
        const int line = LineOf(node);

        if (type == "identifier" || type == "keyword_identifier") return Make(NodeKind::Name, line, text(node));
        if (type == "integer" || type == "float") return Make(NodeKind::Constant, line, text(node));
        if (type == "true") return Make(NodeKind::Constant, line, "True");
        if (type == "false") return Make(NodeKind::Constant, line, "False");
        if (type == "none") return Make(NodeKind::Constant, line, "None");
        if (type == "ellipsis") return Make(NodeKind::Constant, line, "Ellipsis");
        if (type == "string" || type == "concatenated_string") return stringLiteral(node);

        if (type == "parenthesized_expression" || type == "type" || type == "as_pattern_target" ||
            type == "expression") {
            auto children = Named(node);
            if (children.size() == 1) return expr(children.front());
            return sequence(NodeKind::Tuple, node);
        }

        if (type == "binary_operator") {
            const std::string op = ts_node_type(Require(node, "operator"));
            auto it = kBinaryOperators.find(op);
            if (it == kBinaryOperators.end()) throw ParseError(line, "invalid syntax");
            auto binary = Make(NodeKind::BinOp, line);
            binary->add(expr(Require(node, "left")));
            binary->add(Make(NodeKind::Operator, line, it->second));
            binary->add(expr(Require(node, "right")));
            return binary;
        }
        if (type == "unary_operator") {
            auto it = kUnaryOperators.find(ts_node_type(Require(node, "operator")));
            if (it == kUnaryOperators.end()) throw ParseError(line, "invalid syntax");
            auto unary = Make(NodeKind::UnaryOp, line);
            unary->add(Make(NodeKind::Operator, line, it->second));
            unary->add(expr(Require(node, "argument")));
            return unary;
        }
        if (type == "not_operator") {
            auto unary = Make(NodeKind::UnaryOp, line);
            unary->add(Make(NodeKind::Operator, line, "Not"));
            unary->add(expr(Require(node, "argument")));
            return unary;
        }
        if (type == "boolean_operator") return booleanOperator(node);
        if (type == "comparison_operator") return comparison(node);
        if (type == "call") return call(node);
        if (type == "attribute") {
            auto attribute = Make(NodeKind::Attribute, line, text(Require(node, "attribute")));
            attribute->add(expr(Require(node, "object")));
            return attribute;
        }
        if (type == "subscript") return subscript(node);
        if (type == "slice") return sequence(NodeKind::Slice, node);
        if (type == "list" || type == "list_pattern") return sequence(NodeKind::List, node);
        if (type == "set") return sequence(NodeKind::Set, node);
        if (type == "tuple" || type == "expression_list" || type == "pattern_list" || type == "tuple_pattern") {
            return sequence(NodeKind::Tuple, node);
        }
        if (type == "dictionary") return dictionary(node);
        if (type == "list_comprehension") return comprehension(NodeKind::ListComp, node);
        if (type == "set_comprehension") return comprehension(NodeKind::SetComp, node);
        if (type == "generator_expression") return comprehension(NodeKind::GeneratorExp, node);
        if (type == "dictionary_comprehension") return comprehension(NodeKind::DictComp, node);
        if (type == "conditional_expression") {
            // body if test else orelse -> IfExp(test, body, orelse)
            auto parts = Named(node);
            if (parts.size() != 3) throw ParseError(line, "invalid syntax");
            auto conditional = Make(NodeKind::IfExp, line);
            conditional->add(expr(parts[1]));
            conditional->add(expr(parts[0]));
            conditional->add(expr(parts[2]));
            return conditional;
        }
        if (type == "named_expression") {
            auto named = Make(NodeKind::NamedExpr, line);
            named->add(expr(Require(node, "name")));
            named->add(expr(Require(node, "value")));
            return named;
        }
        if (type == "lambda") {
            auto lambda = Make(NodeKind::Lambda, line);
            lambda->add(arguments(Field(node, "parameters"), line));
            lambda->add(expr(Require(node, "body")));
            return lambda;
        }
        if (type == "await") return withOperands(NodeKind::Await, node);
        if (type == "yield") return withOperands(HasToken(node, "from") ? NodeKind::YieldFrom : NodeKind::Yield, node);
        if (type == "list_splat" || type == "list_splat_pattern" || type == "parenthesized_list_splat" ||
            type == "dictionary_splat") {
            return withOperands(NodeKind::Starred, node);
        }
        if (type == "assignment" || type == "augmented_assignment") {
            throw ParseError(line, "invalid syntax");
        }
        if (type == "case_pattern") return pattern(node);

        auto children = Named(node);
        if (children.size() == 1) return expr(children.front());
        return withOperands(NodeKind::Expr, node);
    }

    NodePtr sequence(NodeKind kind, TSNode node) {
        return withOperands(kind, node);
    }

    /// Literal text including prefix and quotes, so '2' never equals the integer 2.
    NodePtr stringLiteral(TSNode node) {
        const std::string raw = text(node);
        bool formatted = false;
        std::vector<TSNode> parts = Is(node, "concatenated_string") ? Named(node) : std::vector<TSNode>{node};
        for (TSNode part : parts) {
            const std::string literal = text(part);
            const size_t quote = literal.find_first_of("'\"");
            const std::string prefix = literal.substr(0, quote);
            if (prefix.find_first_of("fF") != std::string::npos) formatted = true;
        }
        return Make(formatted ? NodeKind::JoinedStr : NodeKind::Constant, LineOf(node), raw);
    }

    NodePtr booleanOperator(TSNode node) {
        const std::string op = ts_node_type(Require(node, "operator"));
        auto boolOp = Make(NodeKind::BoolOp, LineOf(node));
        boolOp->add(Make(NodeKind::Operator, LineOf(node), op == "and" ? "And" : "Or"));

        // a or b or c nests on the left; flatten into one operand list
        std::vector<TSNode> operands;
        TSNode current = node;
        while (Is(current, "boolean_operator") && op == ts_node_type(Require(current, "operator"))) {
            operands.push_back(Require(current, "right"));
            current = Require(current, "left");
        }
        operands.push_back(current);
        for (auto it = operands.rbegin(); it != operands.rend(); ++it) boolOp->add(expr(*it));
        return boolOp;
    }

    NodePtr comparison(TSNode node) {
        auto compare = Make(NodeKind::Compare, LineOf(node));
        std::vector<NodePtr> operands;
        std::vector<NodePtr> operators;
        const uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (ts_node_is_extra(child)) continue;
            if (ts_node_is_named(child)) {
                operands.push_back(expr(child));
                continue;
            }
            auto it = kComparisonOperators.find(ts_node_type(child));
            if (it != kComparisonOperators.end()) {
                operators.push_back(Make(NodeKind::Operator, LineOf(child), it->second));
            }
        }
        if (operands.empty()) throw ParseError(LineOf(node), "invalid syntax");
        // left, ops..., comparators...
        compare->add(std::move(operands.front()));
        for (auto& op : operators) compare->add(std::move(op));
        for (size_t i = 1; i < operands.size(); ++i) compare->add(std::move(operands[i]));
        return compare;
    }

    NodePtr call(TSNode node) {
        auto result = Make(NodeKind::Call, LineOf(node));
        result->add(expr(Require(node, "function")));
        TSNode args = Require(node, "arguments");
        if (Is(args, "generator_expression")) {
            result->add(expr(args));
        } else {
            addCallArguments(*result, args);
        }
        return result;
    }

    /// Positional arguments first, then keywords, as in ast.Call.
    void addCallArguments(SyntaxNode& target, TSNode argumentList) {
        std::vector<NodePtr> keywords;
        for (TSNode arg : Named(argumentList)) {
            if (Is(arg, "keyword_argument")) {
                auto keyword = Make(NodeKind::Keyword, LineOf(arg), text(Require(arg, "name")));
                keyword->add(expr(Require(arg, "value")));
                keywords.push_back(std::move(keyword));
            } else if (Is(arg, "dictionary_splat")) {
                auto keyword = Make(NodeKind::Keyword, LineOf(arg));
                for (TSNode value : Named(arg)) keyword->add(expr(value));
                keywords.push_back(std::move(keyword));
            } else {
                target.add(expr(arg));
            }
        }
        for (auto& keyword : keywords) target.add(std::move(keyword));
    }

    NodePtr subscript(TSNode node) {
        auto result = Make(NodeKind::Subscript, LineOf(node));
        TSNode value = Require(node, "value");
        result->add(expr(value));

        std::vector<NodePtr> items;
        for (TSNode child : Named(node)) {
            if (!ts_node_eq(child, value)) items.push_back(expr(child));
        }
        if (items.size() == 1) {
            result->add(std::move(items.front()));
        } else {
            auto tuple = Make(NodeKind::Tuple, LineOf(node));
            for (auto& item : items) tuple->add(std::move(item));
            result->add(std::move(tuple));
        }
        return result;
    }

    /// Keys first, then values; a **splat contributes a value only.
    NodePtr dictionary(TSNode node) {
        std::vector<NodePtr> keys;
        std::vector<NodePtr> values;
        for (TSNode child : Named(node)) {
            if (Is(child, "pair")) {
                keys.push_back(expr(Require(child, "key")));
                values.push_back(expr(Require(child, "value")));
            } else {
                for (TSNode value : Named(child)) values.push_back(expr(value));
            }
        }
        auto dict = Make(NodeKind::Dict, LineOf(node));
        for (auto& key : keys) dict->add(std::move(key));
        for (auto& value : values) dict->add(std::move(value));
        return dict;
    }

    NodePtr comprehension(NodeKind kind, TSNode node) {
        auto result = Make(kind, LineOf(node));
        TSNode body = Require(node, "body");
        if (kind == NodeKind::DictComp && Is(body, "pair")) {
            result->add(expr(Require(body, "key")));
            result->add(expr(Require(body, "value")));
        } else {
            result->add(expr(body));
        }

        SyntaxNode* current = nullptr;
        for (TSNode clause : Named(node)) {
            if (ts_node_eq(clause, body)) continue;
            if (Is(clause, "for_in_clause")) {
                auto generator = Make(NodeKind::Comprehension, LineOf(clause));
                TSNode target = Require(clause, "left");
                generator->add(expr(target));
                std::vector<TSNode> iterables;
                for (TSNode part : Named(clause)) {
                    if (!ts_node_eq(part, target)) iterables.push_back(part);
                }
                if (iterables.size() == 1) {
                    generator->add(expr(iterables.front()));
                } else {
                    auto tuple = Make(NodeKind::Tuple, LineOf(clause));
                    for (TSNode iterable : iterables) tuple->add(expr(iterable));
                    generator->add(std::move(tuple));
                }
                current = result->add(std::move(generator));
            } else if (Is(clause, "if_clause") && current) {
                for (TSNode condition : Named(clause)) current->add(expr(condition));
            }
        }
        return result;
    }

    const std::string& m_source;
};

} // namespace

std::unique_ptr<domain::SyntaxNode> PythonParser::parse(const std::string& source) const {
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
        throw std::runtime_error("tree-sitter Python grammar could not be loaded");
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, source.c_str(), static_cast<uint32_t>(source.size())));
    if (!tree) {
        throw std::runtime_error("tree-sitter produced no tree");
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (auto problem = FindProblem(root)) {
        throw ParseError(problem->line, problem->message);
    }
    if (ts_node_has_error(root)) {
        throw ParseError(LineOf(root), "invalid syntax");
    }

    Lowering lowering(source);
    return lowering.module(root);
}

} // namespace codegrader::infrastructure
