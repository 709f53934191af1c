/*
 * AST printer tests - zlang
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <zlang/error.hpp>
#include <zlang/parse/ast.hpp>
#include <zlang/parse/parser.hpp>

using namespace zlang;

TEST(AstPrinter, HandBuiltTree) {
    auto sum = make_expr(BinaryExpr{make_expr(IntLiteral{1}), Token(TokenKind::Add), make_expr(IdentifierExpr{"x"})});
    auto neg = make_expr(UnaryExpr{Token(TokenKind::Sub), std::move(sum)});
    auto assign = make_expr(AssignExpr{"y", Token(TokenKind::MulAssign), std::move(neg)});
    EXPECT_EQ(to_string(*assign), "(y *= (-(1 + x)))");

    Program program;
    program.append(ExprStatement{std::move(assign)});
    program.append(ExprStatement{make_expr(StringLiteral{"a b"})});
    EXPECT_EQ(to_string(program), "(y *= (-(1 + x)));\n\"a b\";");
    EXPECT_EQ(program.size(), 2u);
}

TEST(AstPrinter, FloatFormatting) {
    EXPECT_EQ(format_float(1.0), "1.0");
    EXPECT_EQ(format_float(0.5), "0.5");
    EXPECT_EQ(format_float(100.0), "100.0");
    EXPECT_EQ(format_float(1e21), "1e+21");
    EXPECT_EQ(format_float(1e-7), "1e-07");
}

TEST(AstPrinter, OperatorTextComesFromSource) {
    auto program = parse_source("a <= b; !c; d |= e;");
    ASSERT_TRUE(program);
    EXPECT_EQ(to_string(program.value()), "(a <= b);\n(!c);\n(d |= e);");
}

TEST(AstDump, Structure) {
    auto program = parse_source("1 + x; y = true; -\"s\"; 2.5;");
    ASSERT_TRUE(program);
    EXPECT_EQ(dump(program.value()),
              "Program(["
              "ExprStatement(BinaryExpr(left=IntLiteral(1), op=ADD('+'), right=IdentifierExpr('x'))), "
              "ExprStatement(AssignExpr(target='y', op=ASSIGN('='), value=BoolLiteral(true))), "
              "ExprStatement(UnaryExpr(op=SUB('-'), operand=StringLiteral('s'))), "
              "ExprStatement(FloatLiteral(2.5))])");
}

TEST(AstDump, DistinguishesLiteralKinds) {
    auto a = parse_source("1;");
    auto b = parse_source("1.0;");
    ASSERT_TRUE(a && b);
    EXPECT_NE(dump(a.value()), dump(b.value()));
}

TEST(ErrorFormat, KindAndOffset) {
    EXPECT_EQ(to_string(syntax_error("boom", 3)), "SyntaxError: boom (at offset 3)");
    EXPECT_EQ(to_string(lex_error("bad", 0)), "LexError: bad (at offset 0)");
}
