#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace arithexpr {

struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

struct ParseError : Error { using Error::Error; };

struct LexError : Error {
    LexError(char c, std::size_t pos)
        : Error(std::string("Unexpected character: '") + c + "' at position " + std::to_string(pos)),
          c_(c), pos_(pos) {}

    char character() const noexcept { return c_; }
    std::size_t position() const noexcept { return pos_; }

private:
    char c_;
    std::size_t pos_;
};

} // namespace arithexpr
