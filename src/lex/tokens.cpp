/*
 * zlang Token Tables
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Token kind descriptors and the keyword/symbol tables derived
 *              from them. See header for details.
 */
#include <cctype>
#include <utility>
#include <zlang/lex/tokens.hpp>

namespace zlang {

const std::vector<TokenKindInfo>& token_kinds() {
    static const std::vector<TokenKindInfo> kinds = {
        {TokenKind::Illegal, "ILLEGAL", "<illegal>", false},
        {TokenKind::Eof, "EOF", "<eof>", false},
        {TokenKind::Identifier, "IDENTIFIER", "<identifier>", false},
        {TokenKind::Number, "NUMBER", "<number>", false},
        {TokenKind::String, "STRING", "<string>", false},
        {TokenKind::Assign, "ASSIGN", "=", true},
        {TokenKind::Add, "ADD", "+", true},
        {TokenKind::Sub, "SUB", "-", true},
        {TokenKind::Mul, "MUL", "*", true},
        {TokenKind::Div, "DIV", "/", true},
        {TokenKind::AddAssign, "IADD", "+=", true},
        {TokenKind::SubAssign, "ISUB", "-=", true},
        {TokenKind::MulAssign, "IMUL", "*=", true},
        {TokenKind::DivAssign, "IDIV", "/=", true},
        {TokenKind::Not, "NOT", "!", true},
        {TokenKind::And, "AND", "&", true},
        {TokenKind::Or, "OR", "|", true},
        {TokenKind::AndAssign, "IAND", "&=", true},
        {TokenKind::OrAssign, "IOR", "|=", true},
        {TokenKind::Lt, "LT", "<", true},
        {TokenKind::Le, "LE", "<=", true},
        {TokenKind::Gt, "GT", ">", true},
        {TokenKind::Ge, "GE", ">=", true},
        {TokenKind::Eq, "EQ", "==", true},
        {TokenKind::NotEq, "NEQ", "!=", true},
        {TokenKind::Comma, "COMMA", ",", true},
        {TokenKind::Semicolon, "SEMICOLON", ";", true},
        {TokenKind::LeftParen, "LPAREN", "(", true},
        {TokenKind::RightParen, "RPAREN", ")", true},
        {TokenKind::LeftBrace, "LBRACE", "{", true},
        {TokenKind::RightBrace, "RBRACE", "}", true},
        {TokenKind::LeftBracket, "LBRACKET", "[", true},
        {TokenKind::RightBracket, "RBRACKET", "]", true},
        {TokenKind::True, "TRUE", "true", true},
        {TokenKind::False, "FALSE", "false", true},
        {TokenKind::Let, "LET", "let", true},
        {TokenKind::Return, "RETURN", "return", true},
        {TokenKind::Function, "FUNCTION", "fn", true},
        {TokenKind::If, "IF", "if", true},
        {TokenKind::Else, "ELSE", "else", true},
    };
    return kinds;
}

const TokenKindInfo& token_kind_info(TokenKind kind) {
    return token_kinds()[static_cast<std::size_t>(kind)];
}

static bool starts_with_letter(std::string_view text) {
    return !text.empty() && std::isalpha(static_cast<unsigned char>(text.front()));
}

static std::unordered_map<std::string_view, TokenKind> build_table(bool keywords) {
    std::unordered_map<std::string_view, TokenKind> table;
    for (auto &info : token_kinds()) {
        if (!info.fixed_text) continue;
        if (starts_with_letter(info.text) == keywords) table.emplace(info.text, info.kind);
    }
    return table;
}

const std::unordered_map<std::string_view, TokenKind>& keyword_table() {
    static const auto table = build_table(true);
    return table;
}

const std::unordered_map<std::string_view, TokenKind>& symbol_table() {
    static const auto table = build_table(false);
    return table;
}

Token::Token(TokenKind k, std::size_t p) : kind(k), lexeme(canonical_text(k)), pos(p) {}
Token::Token(TokenKind k, std::string text, std::size_t p) : kind(k), lexeme(std::move(text)), pos(p) {}

std::string describe(const Token& tok) {
    std::string out(token_kind_name(tok.kind));
    out += "('"; out += tok.lexeme; out += "')";
    return out;
}

} // namespace zlang
