/*
 * Parselet registry tests - zlang
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <zlang/lex/lexer.hpp>
#include <zlang/parse/parselets.hpp>
#include <zlang/parse/parser.hpp>

using namespace zlang;

static std::string render_with(Parser& parser) {
    auto program = parser.parse();
    if (!program) return "<" + to_string(program.error()) + ">";
    return to_string(program.value());
}

TEST(RegistryStandard, PrefixEntries) {
    auto reg = ParseletRegistry::standard();
    for (auto kind : {TokenKind::Identifier, TokenKind::Number, TokenKind::String, TokenKind::True,
                      TokenKind::False, TokenKind::Add, TokenKind::Sub, TokenKind::Not, TokenKind::LeftParen})
        EXPECT_NE(reg.find_prefix(kind), nullptr) << token_kind_name(kind);
    for (auto kind : {TokenKind::Let, TokenKind::Semicolon, TokenKind::Mul, TokenKind::Eof})
        EXPECT_EQ(reg.find_prefix(kind), nullptr) << token_kind_name(kind);
}

TEST(RegistryStandard, InfixPrecedences) {
    auto reg = ParseletRegistry::standard();
    auto prec = [&](TokenKind kind) { return reg.find_infix(kind)->precedence; };
    for (auto kind : {TokenKind::Assign, TokenKind::AddAssign, TokenKind::SubAssign, TokenKind::MulAssign,
                      TokenKind::DivAssign, TokenKind::AndAssign, TokenKind::OrAssign})
        EXPECT_EQ(prec(kind), Precedence::Assign);
    EXPECT_EQ(prec(TokenKind::Eq), Precedence::Equals);
    EXPECT_EQ(prec(TokenKind::NotEq), Precedence::Equals);
    EXPECT_EQ(prec(TokenKind::Le), Precedence::Lege);
    EXPECT_EQ(prec(TokenKind::And), Precedence::Logical);
    EXPECT_EQ(prec(TokenKind::Or), Precedence::Logical);
    EXPECT_EQ(prec(TokenKind::Sub), Precedence::AddSub);
    EXPECT_EQ(prec(TokenKind::Div), Precedence::MulDiv);
    EXPECT_EQ(reg.find_infix(TokenKind::Not), nullptr);
    EXPECT_TRUE(binds_tighter(Precedence::Equals, Precedence::Logical));
    EXPECT_FALSE(binds_tighter(Precedence::Logical, Precedence::Logical));
}

TEST(RegistryExtension, OverridePrecedence) {
    Lexer lx("1 & 2 == 2;");
    Parser parser(lx);
    parser.register_infix(TokenKind::And, binary_operator_parselet(Precedence::MulDiv));
    EXPECT_EQ(render_with(parser), "((1 & 2) == 2);");
}

TEST(RegistryExtension, NewInfixOperator) {
    // comma operator just above assignment
    Lexer lx("a = 1, 2;");
    Parser parser(lx);
    parser.register_infix(TokenKind::Comma, binary_operator_parselet(static_cast<Precedence>(2)));
    EXPECT_EQ(render_with(parser), "(a = (1 , 2));");
}

TEST(RegistryExtension, NewPrefixForm) {
    Lexer lx("[1 + 2] * 3;");
    Parser parser(lx);
    parser.register_prefix(TokenKind::LeftBracket, {[](Parser& p, const Token&) -> Result<ExprPtr> {
        if (auto st = p.advance(); !st) return st.take_error();
        auto inner = p.parse_expression();
        if (!inner) return inner.take_error();
        if (auto st = p.expect_next(TokenKind::RightBracket, "expected ']'"); !st) return st.take_error();
        return inner.take();
    }});
    EXPECT_EQ(render_with(parser), "((1 + 2) * 3);");

    Lexer unclosed("[1;");
    Parser p2(unclosed, parser.registry());
    EXPECT_EQ(render_with(p2).rfind("<SyntaxError: expected ']'", 0), 0u);
}

TEST(RegistryExtension, KeywordReusesExistingBehavior) {
    Lexer lx("let;");
    Parser parser(lx);
    parser.register_prefix(TokenKind::Let, identifier_parselet());
    EXPECT_EQ(render_with(parser), "let;");
}

TEST(RegistryExtension, RegistrationIsPerParser) {
    Lexer lx("[1];");
    auto reg = ParseletRegistry::standard();
    reg.register_prefix(TokenKind::LeftBracket, group_parselet());
    Parser extended(lx, reg);
    auto ok = extended.parse();
    ASSERT_TRUE(ok);
    EXPECT_EQ(to_string(ok.value()), "1;");

    Parser plain(lx);
    auto program = plain.parse();
    ASSERT_FALSE(program);
    EXPECT_NE(program.error().message.find("no parselet"), std::string::npos);
}

TEST(LiteralConversion, Direct) {
    auto hex = parse_literal(Token(TokenKind::Number, "0x10"));
    ASSERT_TRUE(hex);
    EXPECT_EQ(std::get<IntLiteral>(hex.value()->node).value, 16);
    auto fl = parse_literal(Token(TokenKind::Number, "2.5E+2"));
    ASSERT_TRUE(fl);
    EXPECT_DOUBLE_EQ(std::get<FloatLiteral>(fl.value()->node).value, 250.0);
    // the token's text is ignored for booleans
    auto b = parse_literal(Token(TokenKind::True, "whatever"));
    ASSERT_TRUE(b);
    EXPECT_TRUE(std::get<BoolLiteral>(b.value()->node).value);
    auto bad = parse_literal(Token(TokenKind::Identifier, "x"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, ErrorKind::Syntax);
}
