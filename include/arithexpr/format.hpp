#pragma once
#include <string>
#include "arithexpr/number.hpp"

namespace arithexpr {

/// Display text for a result.
///
/// Integers print as-is. A double with no fractional part prints as the
/// integer it equals ("5", not "5.0"). Other doubles use the shortest text
/// that reads back to the same value, switching to scientific notation when
/// the decimal exponent is below -4 or at least 16 ("2.5", "1e-05").
std::string format_number(const Number& n);

} // namespace arithexpr
