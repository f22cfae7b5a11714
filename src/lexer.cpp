#include "arithexpr/lexer.hpp"
#include <cctype>
#include <utility>

namespace arithexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

std::optional<Token> Lexer::next() {
    skip_ws();
    if (is_end()) return std::nullopt;

    const std::size_t start = i_;
    const char c = s_[i_];

    auto single = [&](TokKind k) {
        ++i_;
        return Token{k, std::string(1, c), start};
    };

    switch (c) {
        case '+': return single(TokKind::Plus);
        case '-': return single(TokKind::Minus);
        case '*': return single(TokKind::Star);
        case '/': return single(TokKind::Slash);
        case '(': return single(TokKind::LParen);
        case ')': return single(TokKind::RParen);
        default: break;
    }

    // Digits with at most one '.'; a second '.' starts the next literal.
    if (is_digit(c) || c == '.') {
        bool seen_dot = (c == '.');
        ++i_;
        while (!is_end()) {
            const char d = s_[i_];
            if (d == '.' && !seen_dot) {
                seen_dot = true;
            } else if (!is_digit(d)) {
                break;
            }
            ++i_;
        }
        return Token{TokKind::Number, std::string(s_.substr(start, i_ - start)), start};
    }

    throw LexError(c, start);
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> out;
    while (auto t = lex.next()) out.push_back(std::move(*t));
    return out;
}

} // namespace arithexpr
