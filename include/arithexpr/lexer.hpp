#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include "arithexpr/error.hpp"
#include "arithexpr/token.hpp"

namespace arithexpr {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Next token, or nullopt once the input is exhausted.
    /// Throws LexError on a character that cannot start a token.
    std::optional<Token> next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    std::size_t i_{0};
};

/// Lex the whole input up front.
std::vector<Token> tokenize(std::string_view input);

} // namespace arithexpr
