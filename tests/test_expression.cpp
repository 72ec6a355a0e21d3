#include <catch2/catch.hpp>

#include "core/Errors.hpp"
#include "text/Expression.hpp"
#include "text/Format.hpp"

namespace {
    std::string eval(const std::string& text) {
        return Expression::evaluate(text).str();
    }
}

TEST_CASE("arithmetic precedence", "[expression]") {
    CHECK(eval("1 + 2 * 3") == "7");
    CHECK(eval("(1 + 2) * 3") == "9");
    CHECK(eval("7 / 2") == "3.5");
    CHECK(eval("7 // 2") == "3");
    CHECK(eval("-7 // 2") == "-4");
    CHECK(eval("-7 % 3") == "2");
    CHECK(eval("7 % -3") == "-2");
    CHECK(eval("2 ** 3 ** 2") == "512");
    CHECK(eval("-2 ** 2") == "-4");
    CHECK(eval("2 ** -1") == "0.5");
    CHECK(eval("10 - 4 - 3") == "3");
    CHECK(eval("1.5 + .25") == "1.75");
}

TEST_CASE("comparisons and logic give 1 or 0", "[expression]") {
    CHECK(eval("3 > 2") == "1");
    CHECK(eval("3 <= 2") == "0");
    CHECK(eval("1 < 2 and 2 < 3") == "1");
    CHECK(eval("1 > 2 || true") == "1");
    CHECK(eval("not (1 == 1)") == "0");
    CHECK(eval("!0 && 5") == "1");
    CHECK(eval("'abc' == 'abc'") == "1");
    CHECK(eval("\"b\" > 'a'") == "1");
    CHECK(eval("'ab' + 'cd'") == "abcd");
}

TEST_CASE("invalid expressions are ExpressionErrors", "[expression]") {
    CHECK_THROWS_AS(Expression::evaluate("1 +"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("1 / 0"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("5 % 0"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("(1 + 2"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("1 2"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("foo"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("__import__('os')"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("'unterminated"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("'a' - 1"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("1; 2"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate("$1 > 0"), ExpressionError);
    CHECK_THROWS_AS(Expression::evaluate(""), ExpressionError);
}

TEST_CASE("fields of an input record", "[expression][awk]") {
    Record r("alice 30 admin");
    CHECK(Expression::evaluate("$2 > 25", r).truthy());
    CHECK_FALSE(Expression::evaluate("$2 > 100", r).truthy());
    CHECK(Expression::evaluate("$1 == 'alice'", r).truthy());
    CHECK(Expression::evaluate("NF == 3", r).truthy());
    CHECK(Expression::evaluate("$0", r).str() == "alice 30 admin");
    CHECK(Expression::evaluate("$9 == ''", r).truthy());
    CHECK(Expression::evaluate("$2 * 2", r).str() == "60");
    // numeric fields compare as numbers, not text
    Record n("9 10");
    CHECK(Expression::evaluate("$1 < $2", n).truthy());
}

TEST_CASE("format_number", "[expression]") {
    CHECK(Expression::format_number(4.0) == "4");
    CHECK(Expression::format_number(-0.0) == "0");
    CHECK(Expression::format_number(0.5) == "0.5");
    CHECK(Expression::format_number(1.0 / 3.0) == "0.333333333333");
    CHECK(Expression::format_number(1e20) == "1e+20");
}

TEST_CASE("printf-style formatting", "[format]") {
    CHECK(Format::printf("%s is %d\\n", {"x", "42"}) == "x is 42\n");
    CHECK(Format::printf("%5.2f|%-4s|%03i", {"3.14159", "ab", "7"}) == " 3.14|ab  |007");
    CHECK(Format::printf("%x %o %c %%", {"255", "8", "hello"}) == "ff 10 h %");
    CHECK(Format::printf("a\\tb\\\\", {}) == "a\tb\\");
    CHECK(Format::printf("%d", {"3.7"}) == "3");
    CHECK(Format::printf("%d", {"-1e18"}) == "-1000000000000000000");
    CHECK_THROWS_AS(Format::printf("%d", {"1e30"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%d", {"-1e19"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%x", {"nan"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%d", {"inf"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%s %s", {"one"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%s", {"one", "two"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%d", {"abc"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("%q", {"x"}), ExpressionError);
    CHECK_THROWS_AS(Format::printf("50%", {}), ExpressionError);
}

TEST_CASE("numfmt placeholders", "[format]") {
    CHECK(Format::numfmt("{}", 3) == "3.0");
    CHECK(Format::numfmt("{}", 2.5) == "2.5");
    CHECK(Format::numfmt("total: {:.2f} MB", 1.23456) == "total: 1.23 MB");
    CHECK(Format::numfmt("{{{}}}", 1) == "{1.0}");
    CHECK_THROWS_AS(Format::numfmt("{:x}", 1), ExpressionError);
    CHECK_THROWS_AS(Format::numfmt("{", 1), ExpressionError);
    CHECK_THROWS_AS(Format::numfmt("}", 1), ExpressionError);
}

TEST_CASE("number parsing", "[format]") {
    CHECK(Format::to_integer("-12") == -12);
    CHECK(Format::to_double("2.5") == Approx(2.5));
    CHECK_THROWS_AS(Format::to_integer("12abc"), ExpressionError);
    CHECK_THROWS_AS(Format::to_integer(""), ExpressionError);
    CHECK_THROWS_AS(Format::to_integer(" 1"), ExpressionError);
    CHECK_THROWS_AS(Format::to_double("1e999"), ExpressionError);
}

TEST_CASE("nesting is bounded", "[expression]") {
    CHECK(eval(std::string(100, '(') + "7" + std::string(100, ')')) == "7");
    CHECK_THROWS_WITH(Expression::evaluate(std::string(200000, '(') + "1"), "expression nested too deeply");
    CHECK_THROWS_AS(Expression::evaluate(std::string(1000, '(') + "1" + std::string(1000, ')')), ExpressionError);

    std::string negs;
    for (int i = 0; i < 1000; ++i) negs += "- ";
    CHECK_THROWS_AS(Expression::evaluate(negs + "1"), ExpressionError);

    std::string nots;
    for (int i = 0; i < 1000; ++i) nots += "! ";
    CHECK_THROWS_AS(Expression::evaluate(nots + "1"), ExpressionError);
}
