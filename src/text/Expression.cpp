#include "Expression.hpp"
#include "TextAlgorithms.hpp"
#include "../core/Errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace {

enum class Tok { Number, String, Field, Name, Op, LParen, RParen, End };

struct Token {
    Tok kind;
    std::string text;
    double number = 0;
};

// A field that looks numeric compares as a number, like awk's strnum.
Value field_value(const std::string& s) {
    if (!s.empty()) {
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end && *end == '\0' && !std::isspace(static_cast<unsigned char>(s[0]))) return Value::of(d);
    }
    return Value::of(s);
}

std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }
        if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            const char* begin = src.c_str() + i;
            char* end = nullptr;
            double d = std::strtod(begin, &end);
            std::size_t len = static_cast<std::size_t>(end - begin);
            out.push_back({Tok::Number, src.substr(i, len), d});
            i += len;
            continue;
        }
        if (c == '\'' || c == '"') {
            std::size_t close = src.find(c, i + 1);
            if (close == std::string::npos) throw ExpressionError("unterminated string");
            out.push_back({Tok::String, src.substr(i + 1, close - i - 1)});
            i = close + 1;
            continue;
        }
        if (c == '$') {
            std::size_t j = i + 1;
            while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) ++j;
            if (j == i + 1) throw ExpressionError("expected a field number after '$'");
            Token t{Tok::Field, src.substr(i, j - i)};
            t.number = std::strtod(src.c_str() + i + 1, nullptr);
            out.push_back(t);
            i = j;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t j = i;
            while (j < src.size() && (std::isalnum(static_cast<unsigned char>(src[j])) || src[j] == '_')) ++j;
            out.push_back({Tok::Name, src.substr(i, j - i)});
            i = j;
            continue;
        }
        if (c == '(') { out.push_back({Tok::LParen, "("}); ++i; continue; }
        if (c == ')') { out.push_back({Tok::RParen, ")"}); ++i; continue; }
        static const char* const two[] = {"**", "//", "==", "!=", "<=", ">=", "&&", "||"};
        bool matched = false;
        for (const char* op : two) {
            if (src.compare(i, 2, op) == 0) {
                out.push_back({Tok::Op, op});
                i += 2;
                matched = true;
                break;
            }
        }
        if (matched) continue;
        if (std::string("+-*/%<>!").find(c) != std::string::npos) {
            out.push_back({Tok::Op, std::string(1, c)});
            ++i;
            continue;
        }
        throw ExpressionError(std::string("unexpected character '") + c + "'");
    }
    out.push_back({Tok::End, ""});
    return out;
}

class ExprParser {
public:
    ExprParser(std::vector<Token> tokens, const Record* record)
        : tokens_(std::move(tokens)), record_(record) {}

    Value parse() {
        Value v = parse_or();
        if (peek().kind != Tok::End) throw ExpressionError("unexpected '" + peek().text + "'");
        return v;
    }

private:
    static constexpr std::size_t kMaxNesting = 256;

    // Every recursive path ('(', unary signs, '!') passes through
    // parse_unary or parse_not, which hold one of these.
    struct Nest {
        std::size_t& depth;
        explicit Nest(std::size_t& d) : depth(d) {
            if (++depth > kMaxNesting) {
                --depth;
                throw ExpressionError("expression nested too deeply");
            }
        }
        ~Nest() { --depth; }
    };

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    const Record* record_;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& next() { return tokens_[pos_++]; }

    bool accept_op(const char* op) {
        if (peek().kind == Tok::Op && peek().text == op) { ++pos_; return true; }
        return false;
    }
    bool accept_name(const char* name) {
        if (peek().kind == Tok::Name && peek().text == name) { ++pos_; return true; }
        return false;
    }

    static double numeric(const Value& v, const char* op) {
        if (v.is_string) throw ExpressionError(std::string("operator ") + op + " needs numbers");
        return v.number;
    }

    Value parse_or() {
        Value left = parse_and();
        while (accept_op("||") || accept_name("or")) {
            Value right = parse_and();
            left = Value::of(left.truthy() || right.truthy() ? 1.0 : 0.0);
        }
        return left;
    }

    Value parse_and() {
        Value left = parse_not();
        while (accept_op("&&") || accept_name("and")) {
            Value right = parse_not();
            left = Value::of(left.truthy() && right.truthy() ? 1.0 : 0.0);
        }
        return left;
    }

    Value parse_not() {
        Nest nest(depth_);
        if (accept_op("!") || accept_name("not")) {
            return Value::of(parse_not().truthy() ? 0.0 : 1.0);
        }
        return parse_compare();
    }

    Value parse_compare() {
        Value left = parse_sum();
        static const char* const ops[] = {"==", "!=", "<=", ">=", "<", ">"};
        for (const char* op : ops) {
            if (!accept_op(op)) continue;
            Value right = parse_sum();
            return Value::of(compare(left, right, op) ? 1.0 : 0.0);
        }
        return left;
    }

    static bool compare(const Value& a, const Value& b, const std::string& op) {
        int c;
        if (a.is_string || b.is_string) {
            // mixed operands compare as text, as in awk
            c = a.str().compare(b.str());
        } else {
            c = a.number < b.number ? -1 : (a.number > b.number ? 1 : 0);
        }
        if (op == "==") return c == 0;
        if (op == "!=") return c != 0;
        if (op == "<") return c < 0;
        if (op == "<=") return c <= 0;
        if (op == ">") return c > 0;
        return c >= 0;
    }

    Value parse_sum() {
        Value left = parse_term();
        while (true) {
            if (accept_op("+")) {
                Value right = parse_term();
                if (left.is_string && right.is_string) left = Value::of(left.text + right.text);
                else left = Value::of(numeric(left, "+") + numeric(right, "+"));
            } else if (accept_op("-")) {
                Value right = parse_term();
                left = Value::of(numeric(left, "-") - numeric(right, "-"));
            } else {
                return left;
            }
        }
    }

    Value parse_term() {
        Value left = parse_unary();
        while (true) {
            if (accept_op("*")) {
                left = Value::of(numeric(left, "*") * numeric(parse_unary(), "*"));
            } else if (accept_op("//")) {
                double d = numeric(parse_unary(), "//");
                if (d == 0) throw ExpressionError("division by zero");
                left = Value::of(std::floor(numeric(left, "//") / d));
            } else if (accept_op("/")) {
                double d = numeric(parse_unary(), "/");
                if (d == 0) throw ExpressionError("division by zero");
                left = Value::of(numeric(left, "/") / d);
            } else if (accept_op("%")) {
                double d = numeric(parse_unary(), "%");
                if (d == 0) throw ExpressionError("modulo by zero");
                double r = std::fmod(numeric(left, "%"), d);
                // result takes the sign of the divisor
                if (r != 0 && ((r < 0) != (d < 0))) r += d;
                left = Value::of(r);
            } else {
                return left;
            }
        }
    }

    Value parse_unary() {
        Nest nest(depth_);
        if (accept_op("-")) return Value::of(-numeric(parse_unary(), "-"));
        if (accept_op("+")) return Value::of(numeric(parse_unary(), "+"));
        return parse_power();
    }

    Value parse_power() {
        Value base = parse_primary();
        if (accept_op("**")) {
            double e = numeric(parse_unary(), "**");
            return Value::of(std::pow(numeric(base, "**"), e));
        }
        return base;
    }

    Value parse_primary() {
        const Token& t = next();
        switch (t.kind) {
            case Tok::Number: return Value::of(t.number);
            case Tok::String: return Value::of(t.text);
            case Tok::Field: return field(static_cast<std::size_t>(t.number));
            case Tok::Name:
                if (t.text == "true") return Value::of(1.0);
                if (t.text == "false") return Value::of(0.0);
                if (t.text == "NF") {
                    if (!record_) throw ExpressionError("NF is only defined for input lines");
                    return Value::of(static_cast<double>(record_->fields.size()));
                }
                throw ExpressionError("unknown name '" + t.text + "'");
            case Tok::LParen: {
                Value v = parse_or();
                if (next().kind != Tok::RParen) throw ExpressionError("expected ')'");
                return v;
            }
            case Tok::End: throw ExpressionError("unexpected end of expression");
            default: break;
        }
        throw ExpressionError("unexpected '" + t.text + "'");
    }

    Value field(std::size_t n) const {
        if (!record_) throw ExpressionError("fields are only defined for input lines");
        if (n == 0) return Value::of(record_->line);
        if (n > record_->fields.size()) return Value::of(std::string());
        return field_value(record_->fields[n - 1]);
    }
};

}

Value Value::of(double n) {
    Value v;
    v.number = n;
    return v;
}

Value Value::of(const std::string& s) {
    Value v;
    v.is_string = true;
    v.text = s;
    return v;
}

bool Value::truthy() const {
    return is_string ? !text.empty() : number != 0;
}

std::string Value::str() const {
    return is_string ? text : Expression::format_number(number);
}

Record::Record(const std::string& text)
    : line(text), fields(TextAlgorithms::split_words(text)) {}

namespace Expression {

Value evaluate(const std::string& text) {
    return ExprParser(tokenize(text), nullptr).parse();
}

Value evaluate(const std::string& text, const Record& record) {
    return ExprParser(tokenize(text), &record).parse();
}

std::string format_number(double n) {
    if (std::isnan(n)) return "nan";
    if (std::isinf(n)) return n < 0 ? "-inf" : "inf";
    char buf[64];
    if (n == std::floor(n) && std::fabs(n) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", n);
        std::string s = buf;
        return s == "-0" ? "0" : s;
    }
    std::snprintf(buf, sizeof(buf), "%.12g", n);
    return buf;
}

}
