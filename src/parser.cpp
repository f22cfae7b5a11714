#include "arithexpr/parser.hpp"
#include "arithexpr/lexer.hpp"

#include <charconv>
#include <limits>
#include <string>
#include <system_error>

namespace arithexpr {

static Number parse_literal(const std::string& text) {
    if (text.find('.') == std::string::npos) {
        std::int64_t i = 0;
        const char* first = text.data();
        const char* last = first + text.size();
        auto [end, ec] = std::from_chars(first, last, i);
        if (ec == std::errc::result_out_of_range)
            throw ParseError("Integer literal out of range: '" + text + "'");
        if (ec != std::errc() || end != last) throw ParseError("Invalid number: '" + text + "'");
        return i;
    }

    // Out-of-range text saturates like float arithmetic does: to infinity
    // when the integer part is non-zero, to zero otherwise.
    double d = 0.0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [end, ec] = std::from_chars(first, last, d);
    if (ec == std::errc::result_out_of_range && end == last) {
        const bool large = text.find_first_of("123456789") < text.find('.');
        return large ? std::numeric_limits<double>::infinity() : 0.0;
    }
    if (ec != std::errc() || end != last) throw ParseError("Invalid number: '" + text + "'");
    return d;
}

Number Parser::parse() {
    idx_ = 0;
    depth_ = 0;
    Number result = expr();
    if (const Token* t = peek()) throw ParseError("Unexpected token: '" + t->text + "'");
    return result;
}

Number Parser::expr() {
    Number left = term();
    while (peek_is(TokKind::Plus) || peek_is(TokKind::Minus)) {
        TokKind op = advance().kind;
        Number right = term();
        left = (op == TokKind::Plus) ? left + right : left - right;
    }
    return left;
}

Number Parser::term() {
    Number left = factor();
    while (peek_is(TokKind::Star) || peek_is(TokKind::Slash)) {
        TokKind op = advance().kind;
        Number right = factor();
        if (op == TokKind::Star) {
            left = left * right;
        } else {
            if (right.is_zero()) throw ParseError("Division by zero");
            left = left / right;
        }
    }
    return left;
}

Number Parser::factor() {
    if (peek_is(TokKind::Plus) || peek_is(TokKind::Minus)) {
        TokKind op = advance().kind;
        enter();
        Number operand = factor();
        leave();
        return (op == TokKind::Minus) ? -operand : operand;
    }
    return atom();
}

Number Parser::atom() {
    const Token* t = peek();
    if (!t) throw ParseError("Unexpected end of expression");

    switch (t->kind) {
        case TokKind::LParen: {
            advance();
            enter();
            Number inner = expr();
            leave();
            expect(TokKind::RParen, ")");
            return inner;
        }
        case TokKind::Number:
            return parse_literal(advance().text);
        default:
            throw ParseError("Unexpected token: '" + t->text + "'");
    }
}

const Token* Parser::peek() const {
    return idx_ < toks_.size() ? &toks_[idx_] : nullptr;
}

bool Parser::peek_is(TokKind k) const {
    const Token* t = peek();
    return t && t->kind == k;
}

const Token& Parser::advance() {
    return toks_[idx_++];
}

void Parser::expect(TokKind k, std::string_view text) {
    const Token* t = peek();
    if (!t) throw ParseError("Expected '" + std::string(text) + "', got end of expression");
    if (t->kind != k) throw ParseError("Expected '" + std::string(text) + "', got '" + t->text + "'");
    advance();
}

void Parser::enter() {
    if (++depth_ > opts_.max_depth)
        throw ParseError("Maximum nesting depth exceeded (" + std::to_string(opts_.max_depth) + ")");
}

Number evaluate(std::string_view input, ParserOptions options) {
    Parser p(tokenize(input), options);
    return p.parse();
}

} // namespace arithexpr
