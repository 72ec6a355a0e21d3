#pragma once
#include <string>
#include <vector>

namespace Format {
    // C-style formatting of string arguments. Conversions: %s %d %i %f %x
    // %o %c %% with optional flags, width and precision. Escapes: \n \t \\.
    // Throws ExpressionError for a bad conversion, a non-numeric argument
    // to a numeric conversion, or an argument count that does not match.
    std::string printf(const std::string& format, const std::vector<std::string>& args);

    // Replaces "{}" and "{:.Nf}" placeholders with `number`; "{{" and "}}"
    // are literal braces.
    std::string numfmt(const std::string& format, double number);

    // Parses the whole string as a number; ExpressionError otherwise.
    double to_double(const std::string& s);
    long long to_integer(const std::string& s);
}
