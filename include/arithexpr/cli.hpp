#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace arithexpr {

/// Command-line front end.
///
/// With arguments, the expression is the arguments joined by spaces;
/// without, it is one line read from `in`. Writes the formatted result or
/// "Error: <message>" to `out` and returns the process exit status.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out);

} // namespace arithexpr
