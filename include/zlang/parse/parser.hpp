/*
 * zlang Parser Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares the Parser, a precedence-climbing (Pratt) engine that pulls
 *   tokens lazily from a Lexer with one token of lookahead and delegates each
 *   token to the prefix/infix parselets in its registry. parse() yields a
 *   Program of expression statements or the first lexical/syntax error met.
 *   Implementation resides in parser.cpp.
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
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include "zlang/error.hpp"
#include "zlang/lex/lexer.hpp"
#include "zlang/parse/ast.hpp"
#include "zlang/parse/parselets.hpp"

namespace zlang {

class Parser {
public:
    // Bound on expression nesting (prefix chains, parentheses, operator chains)
    // so that parsing, printing and destroying a tree stay within the stack.
    static constexpr std::size_t max_nesting_depth = 1000;

    // The lexer must outlive the parser.
    explicit Parser(const Lexer& lexer, ParseletRegistry registry = ParseletRegistry::standard());
    Parser(Lexer&&, ParseletRegistry = ParseletRegistry::standard()) = delete;

    // Extension points; call before parse().
    void register_prefix(TokenKind kind, PrefixParselet parselet) { m_registry.register_prefix(kind, std::move(parselet)); }
    void register_infix(TokenKind kind, InfixParselet parselet) { m_registry.register_infix(kind, std::move(parselet)); }
    const ParseletRegistry& registry() const { return m_registry; }

    Result<Program> parse();

    // Used by parselets.
    Result<ExprPtr> parse_expression(Precedence precedence = Precedence::Default);
    Status advance();
    const std::optional<Token>& current() const { return m_current; }
    const std::optional<Token>& lookahead() const { return m_lookahead; }
    // Advances and requires the new current token to be of `kind`.
    Status expect_next(TokenKind kind, std::string_view message);
private:
    Status init();
    Result<std::optional<ExprStatement>> parse_statement();
    Result<ExprStatement> parse_expr_statement();
    std::size_t error_pos() const;

    const Lexer& m_lexer;
    ParseletRegistry m_registry;
    std::optional<TokenCursor> m_tokens;
    std::optional<Token> m_current;
    std::optional<Token> m_lookahead;
    std::size_t m_depth = 0;
};

// Lexes and parses a whole source string.
Result<Program> parse_source(std::string_view source);

} // namespace zlang
