/*
 * zlang Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Provides lexical analysis for zlang. A Lexer owns a complete source string
 *   and hands out TokenCursor objects that scan it lazily, one token per
 *   next() call, always finishing with a single end-of-input token. Strings,
 *   one/two character operators (maximal munch), punctuation, identifiers,
 *   keywords and decimal/hex/float numerals are recognised here; the numeral
 *   text is kept raw for conversion by the parser.
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
#include <string_view>
#include <cstddef>
#include <optional>
#include "zlang/error.hpp"
#include "zlang/lex/tokens.hpp"

namespace zlang {

// Forward-only scan over a source string owned by a Lexer. Not restartable:
// once the end-of-input token has been returned, or a scan error reported,
// next() yields std::nullopt.
class TokenCursor {
public:
    explicit TokenCursor(std::string_view input);
    Result<std::optional<Token>> next();
    bool done() const { return m_done; }
private:
    Result<Token> scan();
    char peek(std::size_t ahead = 0) const;
    char get();
    bool eof() const;
    void skip_space();
    Result<Token> lex_string();
    Token lex_operator();
    Token lex_punctuation();
    Token lex_identifier();
    Result<Token> lex_number();
    bool is_hex_prefix() const;

    std::string_view m_input;
    std::size_t m_pos = 0; // current index
    bool m_done = false;
};

class Lexer {
public:
    explicit Lexer(std::string input);
    // Each call starts an independent scan; the Lexer must outlive the cursor.
    TokenCursor tokens() const&;
    TokenCursor tokens() const&& = delete;
    // Full scan, end-of-input token included.
    Result<TokenStream> run() const;
    const std::string& input() const { return m_input; }
private:
    std::string m_input;
};

bool is_whitespace(char c);
bool is_operator_start(char c);
bool is_punctuation(char c);
bool is_identifier_start(char c);
bool is_identifier_char(char c);

} // namespace zlang
