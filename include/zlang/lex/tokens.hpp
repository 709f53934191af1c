/*
 * zlang Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines token kinds and the Token structure shared by the lexer and the
 *   parser. Kinds fall into three groups: sentinels (illegal, end of input),
 *   variable-text kinds (identifier, number, string) and fixed-text kinds
 *   (operators, punctuation, keywords) whose canonical text is the lexeme.
 *   The keyword and symbol lookup tables used by the lexer are derived from
 *   the descriptor table below, so adding an operator or keyword only means
 *   extending TokenKind and that table.
 *
 * License (MIT): (see full text in error.hpp header or duplicate below)
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
#include <string_view>
#include <cstddef>
#include <vector>
#include <unordered_map>

namespace zlang {

enum class TokenKind {
    // sentinels
    Illegal,
    Eof,

    // variable text
    Identifier,
    Number,
    String,

    // operators
    Assign,
    Add,
    Sub,
    Mul,
    Div,
    AddAssign,
    SubAssign,
    MulAssign,
    DivAssign,
    Not,
    And,
    Or,
    AndAssign,
    OrAssign,
    Lt,
    Le,
    Gt,
    Ge,
    Eq,
    NotEq,

    // punctuation
    Comma,
    Semicolon,
    LeftParen,
    RightParen,
    LeftBrace,
    RightBrace,
    LeftBracket,
    RightBracket,

    // keywords
    True,
    False,
    Let,
    Return,
    Function,
    If,
    Else
};

struct TokenKindInfo {
    TokenKind kind;
    std::string_view name;  // display name, e.g. "ADD"
    std::string_view text;  // canonical text
    bool fixed_text;        // text is the lexeme itself
};

// One entry per TokenKind, in declaration order.
const std::vector<TokenKindInfo>& token_kinds();
const TokenKindInfo& token_kind_info(TokenKind kind);

inline std::string_view token_kind_name(TokenKind kind) { return token_kind_info(kind).name; }
inline std::string_view canonical_text(TokenKind kind) { return token_kind_info(kind).text; }

// Fixed-text kinds whose text starts with a letter.
const std::unordered_map<std::string_view, TokenKind>& keyword_table();
// Fixed-text kinds whose text does not start with a letter.
const std::unordered_map<std::string_view, TokenKind>& symbol_table();

struct Token {
    TokenKind kind = TokenKind::Illegal;
    std::string lexeme;
    std::size_t pos = 0;

    Token() = default;
    // lexeme defaults to the kind's canonical text
    explicit Token(TokenKind k, std::size_t p = 0);
    Token(TokenKind k, std::string text, std::size_t p = 0);
};

// ADD('+')
std::string describe(const Token& tok);

using TokenStream = std::vector<Token>;

} // namespace zlang
