#pragma once
#include <cstdint>
#include <variant>

namespace arithexpr {

/// Result of an evaluation: an exact integer or a double.
///
/// + - * keep the integer tag when both sides are integers and promote to
/// double otherwise. / always produces a double. Integer results that do not
/// fit in 64 bits throw ParseError.
struct Number {
    std::variant<std::int64_t, double> v{std::int64_t{0}};

    Number() = default;
    Number(int i) : v(std::int64_t{i}) {}
    Number(std::int64_t i) : v(i) {}
    Number(double d) : v(d) {}

    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(v); }
    bool is_float() const noexcept { return std::holds_alternative<double>(v); }

    std::int64_t integer() const { return std::get<std::int64_t>(v); }
    double real() const { return std::get<double>(v); }

    /// Value as a double regardless of tag.
    double to_double() const noexcept;
    /// True for integer 0, 0.0 and -0.0.
    bool is_zero() const noexcept;
};

Number operator+(const Number& a, const Number& b);
Number operator-(const Number& a, const Number& b);
Number operator*(const Number& a, const Number& b);
Number operator/(const Number& a, const Number& b);

Number operator-(const Number& a);

// Same tag and same value.
bool operator==(const Number& a, const Number& b);
bool operator!=(const Number& a, const Number& b);

} // namespace arithexpr
