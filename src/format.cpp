#include "arithexpr/format.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace arithexpr {

static std::string format_whole(double d) {
    if (d == 0.0) return "0"; // also -0.0
    std::array<char, 512> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::fixed, 0);
    return std::string(buf.data(), res.ptr);
}

// Shortest round-trip digits, laid out positionally or in scientific form.
static std::string format_fraction(double d) {
    std::array<char, 64> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::scientific);
    const std::string sci(buf.data(), res.ptr);

    // sci looks like "-1.2345e-05"
    const std::size_t e = sci.find('e');
    const bool negative = sci[0] == '-';
    std::string mantissa = sci.substr(negative ? 1 : 0, e - (negative ? 1 : 0));
    const int exp = std::atoi(sci.c_str() + e + 1);

    std::string digits;
    for (char c : mantissa)
        if (c != '.') digits.push_back(c);

    std::string out = negative ? "-" : "";

    if (exp < -4 || exp >= 16) {
        out += digits.substr(0, 1);
        if (digits.size() > 1) {
            out += '.';
            out += digits.substr(1);
        }
        out += 'e';
        out += exp < 0 ? '-' : '+';
        const int mag = exp < 0 ? -exp : exp;
        if (mag < 10) out += '0';
        out += std::to_string(mag);
        return out;
    }

    if (exp < 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-exp - 1), '0');
        out += digits;
        return out;
    }

    // A non-whole value always has digits past the decimal point here.
    const std::size_t int_len = static_cast<std::size_t>(exp) + 1;
    out += digits.substr(0, int_len);
    out += '.';
    out += digits.substr(int_len);
    return out;
}

std::string format_number(const Number& n) {
    if (n.is_integer()) return std::to_string(n.integer());

    const double d = n.real();
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    if (d == std::trunc(d)) return format_whole(d);
    return format_fraction(d);
}

} // namespace arithexpr
