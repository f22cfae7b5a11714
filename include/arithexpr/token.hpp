#pragma once
#include <cstddef>
#include <string>

namespace arithexpr {

enum class TokKind {
    Number,

    Plus, Minus, Star, Slash,
    LParen, RParen,
};

struct Token {
    TokKind kind{TokKind::Number};
    std::string text{};   // source text, verbatim
    std::size_t pos{0};   // byte offset of the first character
};

} // namespace arithexpr
