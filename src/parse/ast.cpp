/*
 * zlang AST Printer
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Canonical text and structural dump of AST nodes. See header
 *              for details.
 */
#include <charconv>
#include <type_traits>
#include <zlang/parse/ast.hpp>

namespace zlang {

std::string format_float(double value) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".eEn") == std::string::npos) out += ".0"; // "n": inf/nan
    return out;
}

std::string to_string(const Expression& expr) {
    return std::visit([&](auto &node)->std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, IdentifierExpr>) return node.name;
        else if constexpr (std::is_same_v<T, IntLiteral>) return std::to_string(node.value);
        else if constexpr (std::is_same_v<T, FloatLiteral>) return format_float(node.value);
        else if constexpr (std::is_same_v<T, BoolLiteral>) return node.value ? "true" : "false";
        else if constexpr (std::is_same_v<T, StringLiteral>) return "\"" + node.value + "\"";
        else if constexpr (std::is_same_v<T, UnaryExpr>) return "(" + node.op.lexeme + to_string(*node.operand) + ")";
        else if constexpr (std::is_same_v<T, BinaryExpr>)
            return "(" + to_string(*node.left) + " " + node.op.lexeme + " " + to_string(*node.right) + ")";
        else return "(" + node.target + " " + node.op.lexeme + " " + to_string(*node.value) + ")";
    }, expr.node);
}

std::string to_string(const ExprStatement& stmt) { return to_string(*stmt.expr) + ";"; }

std::string to_string(const Program& program) {
    std::string out;
    for (std::size_t i = 0; i < program.statements.size(); ++i) {
        if (i) out += "\n";
        out += to_string(program.statements[i]);
    }
    return out;
}

static std::string quoted(const std::string& s) { return "'" + s + "'"; }

std::string dump(const Expression& expr) {
    return std::visit([&](auto &node)->std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, IdentifierExpr>) return "IdentifierExpr(" + quoted(node.name) + ")";
        else if constexpr (std::is_same_v<T, IntLiteral>) return "IntLiteral(" + std::to_string(node.value) + ")";
        else if constexpr (std::is_same_v<T, FloatLiteral>) return "FloatLiteral(" + format_float(node.value) + ")";
        else if constexpr (std::is_same_v<T, BoolLiteral>) return std::string("BoolLiteral(") + (node.value ? "true" : "false") + ")";
        else if constexpr (std::is_same_v<T, StringLiteral>) return "StringLiteral(" + quoted(node.value) + ")";
        else if constexpr (std::is_same_v<T, UnaryExpr>)
            return "UnaryExpr(op=" + describe(node.op) + ", operand=" + dump(*node.operand) + ")";
        else if constexpr (std::is_same_v<T, BinaryExpr>)
            return "BinaryExpr(left=" + dump(*node.left) + ", op=" + describe(node.op) + ", right=" + dump(*node.right) + ")";
        else return "AssignExpr(target=" + quoted(node.target) + ", op=" + describe(node.op) + ", value=" + dump(*node.value) + ")";
    }, expr.node);
}

std::string dump(const Program& program) {
    std::string out = "Program([";
    for (std::size_t i = 0; i < program.statements.size(); ++i) {
        if (i) out += ", ";
        out += "ExprStatement(" + dump(*program.statements[i].expr) + ")";
    }
    return out + "])";
}

} // namespace zlang
