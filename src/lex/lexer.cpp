/*
 * zlang Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Scans a source string into tokens (strings, operators,
 *              punctuation, identifiers/keywords, numerals). See header for
 *              details.
 */
#include <cctype>
#include <utility>
#include <zlang/lex/lexer.hpp>

namespace zlang {

bool is_whitespace(char c) { return c==' ' || c=='\t' || c=='\r' || c=='\n'; }
bool is_operator_start(char c) {
    return c=='=' || c=='!' || c=='<' || c=='>' || c=='+' || c=='-' || c=='*' || c=='/' || c=='&' || c=='|';
}
bool is_punctuation(char c) {
    return c==',' || c==';' || c=='(' || c==')' || c=='{' || c=='}' || c=='[' || c==']';
}
bool is_identifier_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_identifier_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

TokenCursor::TokenCursor(std::string_view input) : m_input(input) {}

char TokenCursor::peek(std::size_t ahead) const {
    return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0';
}
char TokenCursor::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool TokenCursor::eof() const { return m_pos >= m_input.size(); }

void TokenCursor::skip_space() { while (!eof() && is_whitespace(peek())) get(); }

Result<Token> TokenCursor::lex_string() {
    std::size_t start = m_pos;
    get(); // opening quote
    std::size_t close = m_input.find('"', m_pos);
    if (close == std::string_view::npos) {
        m_pos = m_input.size();
        return lex_error("unterminated string literal: the string must be enclosed in double quotes", start);
    }
    std::string text(m_input.substr(m_pos, close - m_pos));
    m_pos = close + 1;
    return Token{TokenKind::String, std::move(text), start};
}

Token TokenCursor::lex_operator() {
    std::size_t start = m_pos;
    // only one character of lookahead: "x=" wins over "x"
    std::size_t len = peek(1) == '=' ? 2 : 1;
    std::string_view lexeme = m_input.substr(start, len);
    m_pos += len;
    auto it = symbol_table().find(lexeme);
    if (it == symbol_table().end()) return {TokenKind::Illegal, std::string(lexeme), start};
    return Token{it->second, start};
}

Token TokenCursor::lex_punctuation() {
    std::size_t start = m_pos;
    std::string_view lexeme = m_input.substr(start, 1);
    get();
    auto it = symbol_table().find(lexeme);
    if (it == symbol_table().end()) return {TokenKind::Illegal, std::string(lexeme), start};
    return Token{it->second, start};
}

Token TokenCursor::lex_identifier() {
    std::size_t start = m_pos;
    while (!eof() && is_identifier_char(peek())) get();
    std::string text(m_input.substr(start, m_pos - start));
    auto it = keyword_table().find(text);
    TokenKind kind = it == keyword_table().end() ? TokenKind::Identifier : it->second;
    return {kind, std::move(text), start};
}

bool TokenCursor::is_hex_prefix() const {
    return peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
}

Result<Token> TokenCursor::lex_number() {
    std::size_t start = m_pos;
    if (is_hex_prefix()) {
        m_pos += 2;
        while (!eof() && is_hex_digit(peek())) get();
        return Token{TokenKind::Number, std::string(m_input.substr(start, m_pos - start)), start};
    }
    bool seen_point = false, seen_exp = false;
    get(); // leading digit
    while (!eof()) {
        char c = peek();
        if (c == '.') {
            if (seen_point) return lex_error("the decimal point '.' can only appear once in a number", m_pos);
            seen_point = true; get();
        } else if (c == 'e' || c == 'E') {
            if (seen_exp) return lex_error(std::string("the exponent marker '") + c + "' can only appear once in a number", m_pos);
            seen_exp = true; get();
        } else if (c == '+' || c == '-') {
            char prev = m_input[m_pos - 1];
            if (prev != 'e' && prev != 'E') break;
            get();
        } else if (is_digit(c)) {
            get();
        } else {
            break;
        }
    }
    return Token{TokenKind::Number, std::string(m_input.substr(start, m_pos - start)), start};
}

Result<Token> TokenCursor::scan() {
    skip_space();
    if (eof()) return Token{TokenKind::Eof, m_pos};
    char c = peek();
    if (c == '"') return lex_string();
    if (is_operator_start(c)) return lex_operator();
    if (is_punctuation(c)) return lex_punctuation();
    if (is_identifier_start(c)) return lex_identifier();
    if (is_digit(c)) return lex_number();
    return lex_error(std::string("unknown illegal character: '") + c + "'", m_pos);
}

Result<std::optional<Token>> TokenCursor::next() {
    if (m_done) return std::optional<Token>{};
    auto tok = scan();
    if (!tok) { m_done = true; return tok.take_error(); }
    if (tok.value().kind == TokenKind::Eof) m_done = true;
    return std::optional<Token>{tok.take()};
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

TokenCursor Lexer::tokens() const& { return TokenCursor(m_input); }

Result<TokenStream> Lexer::run() const {
    TokenStream ts; TokenCursor cursor = tokens();
    while (true) {
        auto next = cursor.next();
        if (!next) return next.take_error();
        if (!next.value()) break;
        ts.push_back(std::move(*next.value()));
    }
    return ts;
}

} // namespace zlang
