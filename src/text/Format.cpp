#include "Format.hpp"
#include "../core/Errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace {

std::string render(const std::string& spec, const char* fmt_value) {
    char buf[512];
    int n = std::snprintf(buf, sizeof(buf), spec.c_str(), fmt_value);
    if (n < 0) throw ExpressionError("invalid format '" + spec + "'");
    if (static_cast<std::size_t>(n) < sizeof(buf)) return std::string(buf, static_cast<std::size_t>(n));
    std::string big(static_cast<std::size_t>(n) + 1, '\0');
    std::snprintf(&big[0], big.size(), spec.c_str(), fmt_value);
    big.resize(static_cast<std::size_t>(n));
    return big;
}

template <typename T>
std::string render_number(const std::string& spec, T value) {
    char buf[512];
    int n = std::snprintf(buf, sizeof(buf), spec.c_str(), value);
    if (n < 0) throw ExpressionError("invalid format '" + spec + "'");
    if (static_cast<std::size_t>(n) >= sizeof(buf)) throw ExpressionError("formatted value too wide");
    return std::string(buf, static_cast<std::size_t>(n));
}

// "3.7" is accepted for %d the way a shell printf truncates.
long long integer_arg(const std::string& s) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 0);
    if (!s.empty() && end && *end == '\0' && errno == 0) return v;
    double d = Format::to_double(s);
    // 2^63 is exact as a double; anything at or past it does not fit.
    const double limit = 9223372036854775808.0;
    if (!std::isfinite(d) || d >= limit || d < -limit) throw ExpressionError("integer out of range: '" + s + "'");
    return static_cast<long long>(d);
}

}

namespace Format {

double to_double(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) throw ExpressionError("invalid number: '" + s + "'");
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0' || errno == ERANGE) throw ExpressionError("invalid number: '" + s + "'");
    return v;
}

long long to_integer(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) throw ExpressionError("invalid integer: '" + s + "'");
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (!end || *end != '\0' || errno == ERANGE) throw ExpressionError("invalid integer: '" + s + "'");
    return v;
}

std::string printf(const std::string& format, const std::vector<std::string>& args) {
    std::string out;
    std::size_t next = 0;
    auto take = [&]() -> const std::string& {
        if (next >= args.size()) throw ExpressionError("not enough arguments for format string");
        return args[next++];
    };

    for (std::size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c == '\\' && i + 1 < format.size()) {
            char e = format[++i];
            if (e == 'n') out.push_back('\n');
            else if (e == 't') out.push_back('\t');
            else if (e == '\\') out.push_back('\\');
            else { out.push_back('\\'); out.push_back(e); }
            continue;
        }
        if (c != '%') { out.push_back(c); continue; }
        if (i + 1 >= format.size()) throw ExpressionError("incomplete format");
        if (format[i + 1] == '%') { out.push_back('%'); ++i; continue; }

        // %[flags][width][.precision]conversion
        std::size_t j = i + 1;
        while (j < format.size() && std::string("-+ 0#").find(format[j]) != std::string::npos) ++j;
        while (j < format.size() && std::isdigit(static_cast<unsigned char>(format[j]))) ++j;
        if (j < format.size() && format[j] == '.') {
            ++j;
            while (j < format.size() && std::isdigit(static_cast<unsigned char>(format[j]))) ++j;
        }
        if (j >= format.size()) throw ExpressionError("incomplete format");
        std::string spec = format.substr(i, j - i);
        char conv = format[j];
        switch (conv) {
            case 's':
                out += render(spec + "s", take().c_str());
                break;
            case 'd':
            case 'i':
                out += render_number(spec + "lld", integer_arg(take()));
                break;
            case 'x':
            case 'o':
                out += render_number(spec + "ll" + conv, integer_arg(take()));
                break;
            case 'f':
                out += render_number(spec + "f", to_double(take()));
                break;
            case 'c': {
                const std::string& a = take();
                std::string one = a.empty() ? std::string() : a.substr(0, 1);
                out += render(spec + "s", one.c_str());
                break;
            }
            default:
                throw ExpressionError(std::string("unsupported format character '") + conv + "'");
        }
        i = j;
    }
    if (next < args.size()) throw ExpressionError("not all arguments converted during string formatting");
    return out;
}

std::string numfmt(const std::string& format, double number) {
    std::string out;
    for (std::size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c == '{' && i + 1 < format.size() && format[i + 1] == '{') { out.push_back('{'); ++i; continue; }
        if (c == '}' && i + 1 < format.size() && format[i + 1] == '}') { out.push_back('}'); ++i; continue; }
        if (c == '}') throw ExpressionError("single '}' in format");
        if (c != '{') { out.push_back(c); continue; }

        std::size_t close = format.find('}', i);
        if (close == std::string::npos) throw ExpressionError("unterminated '{' in format");
        std::string field = format.substr(i + 1, close - i - 1);
        if (field.empty()) {
            // Always shows a fraction: 3 -> "3.0".
            std::string s = render_number("%.15g", number);
            if (std::isfinite(number) && s.find_first_of(".e") == std::string::npos) s += ".0";
            out += s;
        } else if (field.size() >= 4 && field.compare(0, 2, ":.") == 0 && field.back() == 'f') {
            std::string digits = field.substr(2, field.size() - 3);
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 2) {
                throw ExpressionError("unsupported placeholder {" + field + "}");
            }
            out += render_number("%." + digits + "f", number);
        } else {
            throw ExpressionError("unsupported placeholder {" + field + "}");
        }
        i = close;
    }
    return out;
}

}
