/*
 * zlang Parselet Registry
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares the precedence ladder and the prefix/infix parselets driven by
 *   the Parser's precedence-climbing loop. A parselet is a strategy object
 *   (a callable plus, for infix parselets, a binding precedence) stored in a
 *   ParseletRegistry keyed by token kind. New operators or keywords are wired
 *   in by inserting entries; the parser loop itself never changes.
 *
 *   Note the ladder: logical operators (&, |) bind looser than equality and
 *   comparison, so "1 & 2 == 2" groups as (1 & (2 == 2)).
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
#include <functional>
#include <unordered_map>
#include "zlang/error.hpp"
#include "zlang/lex/tokens.hpp"
#include "zlang/parse/ast.hpp"

namespace zlang {

class Parser;

enum class Precedence : int {
    Default = -1,
    AssignBelow = 0, // right operand of an assignment
    Assign = 1,      // =, +=, -=, *=, /=, &=, |=
    Logical = 3,     // &, |
    Equals = 4,      // ==, !=
    Lege = 5,        // <, <=, >, >=
    AddSub = 6,      // +, -
    MulDiv = 7,      // *, /
    Prefix = 8       // unary !, +, -
};

inline bool binds_tighter(Precedence op, Precedence min) { return static_cast<int>(min) < static_cast<int>(op); }

// Called with the parser positioned on `token`, the first token of the expression.
struct PrefixParselet {
    std::function<Result<ExprPtr>(Parser& parser, const Token& token)> parse;
};

// Called with the parser positioned on the operator `token`.
struct InfixParselet {
    Precedence precedence = Precedence::Default;
    std::function<Result<ExprPtr>(Parser& parser, ExprPtr left, const Token& token)> parse;
};

PrefixParselet identifier_parselet();
PrefixParselet literal_parselet();
PrefixParselet unary_operator_parselet();
PrefixParselet group_parselet();
InfixParselet binary_operator_parselet(Precedence precedence);
InfixParselet assign_parselet();

// Converts a literal token (number, string, true, false) into its typed node.
Result<ExprPtr> parse_literal(const Token& token);

class ParseletRegistry {
public:
    // Standard zlang grammar.
    static ParseletRegistry standard();

    void register_prefix(TokenKind kind, PrefixParselet parselet);
    void register_infix(TokenKind kind, InfixParselet parselet);

    const PrefixParselet* find_prefix(TokenKind kind) const;
    const InfixParselet* find_infix(TokenKind kind) const;
private:
    std::unordered_map<TokenKind, PrefixParselet> m_prefix;
    std::unordered_map<TokenKind, InfixParselet> m_infix;
};

} // namespace zlang
