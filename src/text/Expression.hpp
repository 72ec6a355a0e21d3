#pragma once
#include <string>
#include <vector>

// Restricted arithmetic/boolean evaluator used by expr, bc and awk.
//
// Grammar (lowest precedence first):
//   or      := and  ( ("||" | "or")  and )*
//   and     := not  ( ("&&" | "and") not )*
//   not     := ("!" | "not") not | compare
//   compare := sum  ( ("==" | "!=" | "<" | "<=" | ">" | ">=") sum )?
//   sum     := term ( ("+" | "-") term )*
//   term    := unary ( ("*" | "/" | "//" | "%") unary )*
//   unary   := ("-" | "+") unary | power
//   power   := primary ( "**" unary )?
//   primary := number | 'text' | "text" | $N | NF | true | false | "(" or ")"
//
// A comparison with a string operand compares text. There are no names
// beyond NF/true/false and nothing is ever executed.

struct Value {
    bool is_string = false;
    double number = 0;
    std::string text;

    static Value of(double n);
    static Value of(const std::string& s);
    bool truthy() const;
    std::string str() const;
};

// One input line seen by awk: $0 is the line, $1.. its whitespace fields.
struct Record {
    std::string line;
    std::vector<std::string> fields;

    explicit Record(const std::string& text);
};

namespace Expression {
    // Throws ExpressionError on a syntax error, an unknown name, a type
    // mismatch or division by zero.
    Value evaluate(const std::string& text);
    Value evaluate(const std::string& text, const Record& record);

    // Integral values without a fraction ("4"), others with up to 12
    // significant digits.
    std::string format_number(double n);
}
