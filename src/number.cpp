#include "arithexpr/number.hpp"
#include "arithexpr/error.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace arithexpr {

double Number::to_double() const noexcept {
    if (is_integer()) return static_cast<double>(std::get<std::int64_t>(v));
    return std::get<double>(v);
}

bool Number::is_zero() const noexcept {
    if (is_integer()) return std::get<std::int64_t>(v) == 0;
    return std::get<double>(v) == 0.0;
}

using Limits = std::numeric_limits<std::int64_t>;

static bool add_overflows(std::int64_t a, std::int64_t b) {
    return (b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b);
}

static bool sub_overflows(std::int64_t a, std::int64_t b) {
    return (b < 0 && a > Limits::max() + b) || (b > 0 && a < Limits::min() + b);
}

static bool mul_overflows(std::int64_t a, std::int64_t b) {
    if (a > 0) {
        if (b > 0) return a > Limits::max() / b;
        return b < Limits::min() / a;
    }
    if (b > 0) return a < Limits::min() / b;
    return a != 0 && b < Limits::max() / a;
}

static std::uint64_t magnitude(std::int64_t i) {
    return i < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(i) : static_cast<std::uint64_t>(i);
}

static int bit_length(std::uint64_t x) {
    int n = 0;
    while (x) {
        ++n;
        x >>= 1;
    }
    return n;
}

// n / d rounded once to the nearest double, ties to even.
static double divide_exact(std::uint64_t n, std::uint64_t d) {
    constexpr int kMantissa = std::numeric_limits<double>::digits; // 53
    if (n == 0) return 0.0;

    std::uint64_t q = n / d;
    std::uint64_t r = n % d;

    const int qbits = bit_length(q);
    if (qbits > kMantissa) {
        // Quotient alone is too wide: drop its low bits, r only breaks ties.
        const int shift = qbits - kMantissa;
        const std::uint64_t low = q & ((std::uint64_t{1} << shift) - 1);
        const std::uint64_t half = std::uint64_t{1} << (shift - 1);
        std::uint64_t kept = q >> shift;
        if (low > half || (low == half && (r != 0 || (kept & 1)))) ++kept;
        return std::ldexp(static_cast<double>(kept), shift);
    }

    // Long division until there is one bit past the mantissa.
    std::uint64_t m = q;
    int exp = 0;
    while (bit_length(m) < kMantissa + 1) {
        r <<= 1; // r < d <= 2^63, no overflow
        m <<= 1;
        if (r >= d) {
            r -= d;
            m |= 1;
        }
        --exp;
    }
    std::uint64_t kept = m >> 1;
    const bool round_bit = (m & 1) != 0;
    if (round_bit && (r != 0 || (kept & 1))) ++kept;
    return std::ldexp(static_cast<double>(kept), exp + 1);
}

Number operator+(const Number& a, const Number& b) {
    if (a.is_integer() && b.is_integer()) {
        if (add_overflows(a.integer(), b.integer())) throw ParseError("Integer overflow");
        return a.integer() + b.integer();
    }
    return a.to_double() + b.to_double();
}

Number operator-(const Number& a, const Number& b) {
    if (a.is_integer() && b.is_integer()) {
        if (sub_overflows(a.integer(), b.integer())) throw ParseError("Integer overflow");
        return a.integer() - b.integer();
    }
    return a.to_double() - b.to_double();
}

Number operator*(const Number& a, const Number& b) {
    if (a.is_integer() && b.is_integer()) {
        if (mul_overflows(a.integer(), b.integer())) throw ParseError("Integer overflow");
        return a.integer() * b.integer();
    }
    return a.to_double() * b.to_double();
}

// True division: the result is a double even for 4 / 2. Two integers are
// divided exactly and rounded once, so values past 2^53 keep full precision.
Number operator/(const Number& a, const Number& b) {
    if (b.is_zero()) throw ParseError("Division by zero");
    if (a.is_integer() && b.is_integer()) {
        const std::int64_t x = a.integer();
        const std::int64_t y = b.integer();
        const double q = divide_exact(magnitude(x), magnitude(y));
        return ((x < 0) != (y < 0)) ? -q : q;
    }
    return a.to_double() / b.to_double();
}

Number operator-(const Number& a) {
    if (a.is_integer()) {
        const std::int64_t i = a.integer();
        if (i == Limits::min()) throw ParseError("Integer overflow");
        return -i;
    }
    return -a.real();
}

bool operator==(const Number& a, const Number& b) {
    return a.v == b.v;
}

bool operator!=(const Number& a, const Number& b) {
    return !(a == b);
}

} // namespace arithexpr
