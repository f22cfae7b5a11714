#pragma once
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>
#include "arithexpr/error.hpp"
#include "arithexpr/number.hpp"
#include "arithexpr/token.hpp"

namespace arithexpr {

struct ParserOptions {
    // Unary prefixes and parenthesised groups each add one level.
    std::size_t max_depth{1000};
};

// Recursive descent that evaluates while it parses:
//
//   expr   -> term (('+' | '-') term)*
//   term   -> factor (('*' | '/') factor)*
//   factor -> ('+' | '-') factor | atom
//   atom   -> NUMBER | '(' expr ')'
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserOptions options = {})
        : toks_(std::move(tokens)), opts_(options) {}

    /// Evaluate the whole token sequence. Throws ParseError.
    Number parse();

private:
    Number expr();
    Number term();
    Number factor();
    Number atom();

    const Token* peek() const;
    bool peek_is(TokKind k) const;
    const Token& advance();
    void expect(TokKind k, std::string_view text);

    void enter();
    void leave() { --depth_; }

    std::vector<Token> toks_;
    ParserOptions opts_;
    std::size_t idx_{0};
    std::size_t depth_{0};
};

/// Tokenize and evaluate. Throws LexError or ParseError.
Number evaluate(std::string_view input, ParserOptions options = {});

} // namespace arithexpr
