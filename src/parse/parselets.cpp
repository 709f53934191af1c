/*
 * zlang Parselet Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Standard prefix/infix parselets, literal conversion and the
 *              registry. See header for details.
 */
#include <charconv>
#include <system_error>
#include <utility>
#include <cstdint>
#include <string>
#include <zlang/parse/parselets.hpp>
#include <zlang/parse/parser.hpp>

namespace zlang {

static Error bad_number(const Token& token, const char* why) {
    return syntax_error(std::string(why) + " number literal: '" + token.lexeme + "'", token.pos);
}

static Result<ExprPtr> parse_number(const Token& token) {
    const std::string& text = token.lexeme;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (text.find_first_of(".eE") != std::string::npos) {
        double value = 0.0;
        auto res = std::from_chars(first, last, value);
        if (res.ec == std::errc::result_out_of_range) return bad_number(token, "out of range");
        if (res.ec != std::errc() || res.ptr != last) return bad_number(token, "malformed");
        return make_expr(FloatLiteral{value});
    }
    int base = 10;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) { base = 16; first += 2; }
    std::int64_t value = 0;
    auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc::result_out_of_range) return bad_number(token, "out of range");
    if (first == last || res.ec != std::errc() || res.ptr != last) return bad_number(token, "malformed");
    return make_expr(IntLiteral{value});
}

Result<ExprPtr> parse_literal(const Token& token) {
    switch (token.kind) {
        case TokenKind::String: return make_expr(StringLiteral{token.lexeme});
        case TokenKind::True: return make_expr(BoolLiteral{true});
        case TokenKind::False: return make_expr(BoolLiteral{false});
        case TokenKind::Number: return parse_number(token);
        default: return syntax_error("not a literal: " + describe(token), token.pos);
    }
}

PrefixParselet identifier_parselet() {
    return {[](Parser&, const Token& token) -> Result<ExprPtr> {
        return make_expr(IdentifierExpr{token.lexeme});
    }};
}

PrefixParselet literal_parselet() {
    return {[](Parser&, const Token& token) -> Result<ExprPtr> { return parse_literal(token); }};
}

// Unary operators: +, -, !
PrefixParselet unary_operator_parselet() {
    return {[](Parser& parser, const Token& token) -> Result<ExprPtr> {
        if (auto st = parser.advance(); !st) return st.take_error(); // onto the operand
        auto operand = parser.parse_expression(Precedence::Prefix);
        if (!operand) return operand.take_error();
        return make_expr(UnaryExpr{token, operand.take()});
    }};
}

// "(" expression ")"; the group itself leaves no node behind.
PrefixParselet group_parselet() {
    return {[](Parser& parser, const Token&) -> Result<ExprPtr> {
        if (auto st = parser.advance(); !st) return st.take_error();
        auto inner = parser.parse_expression(Precedence::Default);
        if (!inner) return inner.take_error();
        if (auto st = parser.expect_next(TokenKind::RightParen, "the grouped expression must end with a right parenthesis ')'"); !st)
            return st.take_error();
        return inner.take();
    }};
}

// Left-associative: the right operand is parsed at the operator's own precedence.
InfixParselet binary_operator_parselet(Precedence precedence) {
    return {precedence, [precedence](Parser& parser, ExprPtr left, const Token& token) -> Result<ExprPtr> {
        if (auto st = parser.advance(); !st) return st.take_error();
        auto right = parser.parse_expression(precedence);
        if (!right) return right.take_error();
        return make_expr(BinaryExpr{std::move(left), token, right.take()});
    }};
}

// Right-associative: "a = b = c" is a = (b = c).
InfixParselet assign_parselet() {
    return {Precedence::Assign, [](Parser& parser, ExprPtr left, const Token& token) -> Result<ExprPtr> {
        auto target = std::get_if<IdentifierExpr>(&left->node);
        if (!target)
            return syntax_error("the left side of an assignment must be a simple identifier, but got: " + to_string(*left), token.pos);
        if (auto st = parser.advance(); !st) return st.take_error();
        auto value = parser.parse_expression(Precedence::AssignBelow);
        if (!value) return value.take_error();
        return make_expr(AssignExpr{target->name, token, value.take()});
    }};
}

ParseletRegistry ParseletRegistry::standard() {
    ParseletRegistry reg;
    reg.register_prefix(TokenKind::Identifier, identifier_parselet());
    for (auto kind : {TokenKind::Number, TokenKind::String, TokenKind::True, TokenKind::False})
        reg.register_prefix(kind, literal_parselet());
    for (auto kind : {TokenKind::Add, TokenKind::Sub, TokenKind::Not})
        reg.register_prefix(kind, unary_operator_parselet());
    reg.register_prefix(TokenKind::LeftParen, group_parselet());

    for (auto kind : {TokenKind::Assign, TokenKind::AddAssign, TokenKind::SubAssign, TokenKind::MulAssign,
                      TokenKind::DivAssign, TokenKind::AndAssign, TokenKind::OrAssign})
        reg.register_infix(kind, assign_parselet());
    for (auto kind : {TokenKind::Eq, TokenKind::NotEq})
        reg.register_infix(kind, binary_operator_parselet(Precedence::Equals));
    for (auto kind : {TokenKind::Lt, TokenKind::Le, TokenKind::Gt, TokenKind::Ge})
        reg.register_infix(kind, binary_operator_parselet(Precedence::Lege));
    for (auto kind : {TokenKind::And, TokenKind::Or})
        reg.register_infix(kind, binary_operator_parselet(Precedence::Logical));
    for (auto kind : {TokenKind::Add, TokenKind::Sub})
        reg.register_infix(kind, binary_operator_parselet(Precedence::AddSub));
    for (auto kind : {TokenKind::Mul, TokenKind::Div})
        reg.register_infix(kind, binary_operator_parselet(Precedence::MulDiv));
    return reg;
}

void ParseletRegistry::register_prefix(TokenKind kind, PrefixParselet parselet) { m_prefix[kind] = std::move(parselet); }
void ParseletRegistry::register_infix(TokenKind kind, InfixParselet parselet) { m_infix[kind] = std::move(parselet); }

const PrefixParselet* ParseletRegistry::find_prefix(TokenKind kind) const {
    auto it = m_prefix.find(kind);
    return it == m_prefix.end() ? nullptr : &it->second;
}

const InfixParselet* ParseletRegistry::find_infix(TokenKind kind) const {
    auto it = m_infix.find(kind);
    return it == m_infix.end() ? nullptr : &it->second;
}

} // namespace zlang
