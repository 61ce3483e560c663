#pragma once
#include <memory>
#include <string>

namespace satr {

// Calibration expression over the single input `raw`.
//
// Accepted grammar (Python-like precedence, lowest first):
//   expr    := or ['if' or 'else' expr]
//   or      := and ('or' and)*
//   and     := cmp ('and' cmp)*
//   cmp     := arith (('=='|'!='|'<'|'<='|'>'|'>=') arith)*
//   arith   := term (('+'|'-') term)*
//   term    := factor (('*'|'/'|'//'|'%') factor)*
//   factor  := ('+'|'-') factor | power
//   power   := atom ['**' factor]
//   atom    := number | string | 'raw' | fn '(' args ')' | 'math' '.' fn '(' args ')'
//            | '(' expr ')'
// where fn is one of sin cos tan asin acos atan sqrt log log10 exp abs fabs
// floor ceil round min max pow.
//
// Anything else (other names, attribute access, subscripts, assignment,
// keywords like lambda/import/not) is rejected by parse() before any
// evaluation happens.
class CalibExpr {
public:
    struct Node;

    // Throws ExpressionError on any syntax or allow-list violation.
    static CalibExpr parse(const std::string& text);

    // Throws ExpressionError on runtime failures (domain/range errors,
    // division by zero, result not coercible to a float).
    double evaluate(double raw) const;

    const std::string& text() const { return text_; }

private:
    CalibExpr(std::string text, std::shared_ptr<const Node> root);

    std::string text_;
    std::shared_ptr<const Node> root_;
};

// Parse and evaluate in one step.
double eval_expr(const std::string& expr, double raw);

bool is_calibration_function(const std::string& name);

// Round to `digits` decimals, ties away from zero (std::round on v * 10^digits).
double round_half_away(double v, int digits);

} // namespace satr
