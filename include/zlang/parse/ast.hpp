/*
 * zlang AST Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines Abstract Syntax Tree node structures for zlang: a Program is an
 *   ordered list of expression statements; expressions are identifiers,
 *   typed literals (int, float, bool, string), unary and binary operator
 *   applications and assignments to a bare identifier. Each node owns its
 *   children exclusively. Also declares the canonical pretty printer and a
 *   structural dump used for diagnostics and tree comparison.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <utility>
#include <variant>
#include "zlang/lex/tokens.hpp"

namespace zlang {

struct Expression;
using ExprPtr = std::unique_ptr<Expression>;

struct IdentifierExpr {
    std::string name;
};

struct IntLiteral {
    std::int64_t value;
};

struct FloatLiteral {
    double value;
};

struct BoolLiteral {
    bool value;
};

struct StringLiteral {
    std::string value; // without quotes
};

struct UnaryExpr {
    Token op;
    ExprPtr operand;
};

struct BinaryExpr {
    ExprPtr left;
    Token op;
    ExprPtr right;
};

// Target is always a bare identifier; the parser rejects anything else.
struct AssignExpr {
    std::string target;
    Token op;
    ExprPtr value;
};

struct Expression {
    using Node = std::variant<IdentifierExpr, IntLiteral, FloatLiteral, BoolLiteral, StringLiteral,
                              UnaryExpr, BinaryExpr, AssignExpr>;
    Node node;
};

template <typename T>
ExprPtr make_expr(T node) { return std::make_unique<Expression>(Expression{std::move(node)}); }

struct ExprStatement {
    ExprPtr expr;
};

struct Program {
    std::vector<ExprStatement> statements;

    void append(ExprStatement stmt) { statements.push_back(std::move(stmt)); }
    std::size_t size() const { return statements.size(); }
    bool empty() const { return statements.empty(); }
};

// Canonical text: every operator node fully parenthesised, strings quoted.
std::string to_string(const Expression& expr);
std::string to_string(const ExprStatement& stmt);
std::string to_string(const Program& program);

// Structural form, e.g. BinaryExpr(left=IntLiteral(1), op=ADD('+'), right=IntLiteral(2))
std::string dump(const Expression& expr);
std::string dump(const Program& program);

// Shortest text that reads back as the same double and still lexes as a float.
std::string format_float(double value);

} // namespace zlang
