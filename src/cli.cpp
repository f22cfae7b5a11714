#include "arithexpr/cli.hpp"
#include "arithexpr/format.hpp"
#include "arithexpr/parser.hpp"

#include <cctype>
#include <istream>
#include <ostream>

namespace arithexpr {

static std::string trim(const std::string& s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += ' ';
        out += parts[i];
    }
    return out;
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out) {
    std::string line;
    if (!args.empty()) {
        line = join(args);
    } else if (!std::getline(in, line)) {
        line.clear(); // end of input reads as an empty line
    }

    const std::string expression = trim(line);
    if (expression.empty()) {
        out << "Error: empty expression\n";
        return 1;
    }

    try {
        const std::string text = format_number(evaluate(expression));
        out << text << "\n";
    } catch (const Error& e) {
        out << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace arithexpr
