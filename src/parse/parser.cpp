/*
 * zlang Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Statement loop and precedence-climbing expression parser. See
 *              header for details.
 */
#include <string>
#include <utility>
#include <zlang/parse/parser.hpp>

namespace zlang {

Parser::Parser(const Lexer& lexer, ParseletRegistry registry) : m_lexer(lexer), m_registry(std::move(registry)) {}

std::size_t Parser::error_pos() const { return m_current ? m_current->pos : m_lexer.input().size(); }

Status Parser::advance() {
    if (!m_tokens) return syntax_error("parser used before parse()", 0);
    m_current = std::exchange(m_lookahead, std::nullopt);
    auto next = m_tokens->next();
    if (!next) return next.take_error();
    m_lookahead = std::move(next.value()); // nullopt past end of input
    return ok_status();
}

Status Parser::expect_next(TokenKind kind, std::string_view message) {
    if (auto st = advance(); !st) return st;
    if (!m_current || m_current->kind != kind) {
        std::string msg(message);
        if (m_current) msg += ", found " + describe(*m_current);
        return syntax_error(std::move(msg), error_pos());
    }
    return ok_status();
}

Status Parser::init() {
    m_tokens.emplace(m_lexer.tokens());
    m_depth = 0;
    m_current.reset(); m_lookahead.reset();
    if (auto st = advance(); !st) return st; // first token into lookahead
    return advance();
}

Result<Program> Parser::parse() {
    if (auto st = init(); !st) return st.take_error();
    Program program;
    while (m_current && m_current->kind != TokenKind::Eof) {
        auto stmt = parse_statement();
        if (!stmt) return stmt.take_error();
        if (stmt.value()) program.append(std::move(*stmt.value()));
        if (auto st = advance(); !st) return st.take_error(); // past the terminator
    }
    return std::move(program);
}

Result<std::optional<ExprStatement>> Parser::parse_statement() {
    if (m_current->kind == TokenKind::Semicolon) return std::optional<ExprStatement>{}; // empty statement
    auto stmt = parse_expr_statement();
    if (!stmt) return stmt.take_error();
    return std::optional<ExprStatement>{stmt.take()};
}

Result<ExprStatement> Parser::parse_expr_statement() {
    auto expr = parse_expression(Precedence::Default);
    if (!expr) return expr.take_error();
    std::string msg = "statement must end with '" + std::string(canonical_text(TokenKind::Semicolon)) + "'";
    if (auto st = expect_next(TokenKind::Semicolon, msg); !st) return st.take_error();
    return ExprStatement{expr.take()};
}

namespace {
// Restores the nesting depth when a parse_expression call returns.
struct DepthGuard {
    std::size_t& depth;
    std::size_t saved;
    ~DepthGuard() { depth = saved; }
};
} // namespace

Result<ExprPtr> Parser::parse_expression(Precedence precedence) {
    DepthGuard guard{m_depth, m_depth};
    if (++m_depth > max_nesting_depth) return syntax_error("expression nested too deeply", error_pos());
    if (!m_current) return syntax_error("unexpected end of input", error_pos());
    const PrefixParselet* prefix = m_registry.find_prefix(m_current->kind);
    if (!prefix) return syntax_error("no parselet for token " + describe(*m_current), m_current->pos);
    Token token = *m_current;
    auto left = prefix->parse(*this, token);
    if (!left) return left.take_error();
    ExprPtr expr = left.take();

    while (m_lookahead) {
        const InfixParselet* infix = m_registry.find_infix(m_lookahead->kind);
        if (!infix || !binds_tighter(infix->precedence, precedence)) break;
        if (auto st = advance(); !st) return st.take_error(); // onto the operator
        Token op = *m_current;
        // each combination adds a level on the left of the tree
        if (++m_depth > max_nesting_depth) return syntax_error("expression nested too deeply", op.pos);
        auto combined = infix->parse(*this, std::move(expr), op);
        if (!combined) return combined.take_error();
        expr = combined.take();
    }
    return std::move(expr);
}

Result<Program> parse_source(std::string_view source) {
    Lexer lexer{std::string(source)};
    Parser parser(lexer);
    return parser.parse();
}

} // namespace zlang
