#include "calib_expr.hpp"
#include "errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace satr {

// ------------------ function allow-list ------------------
enum class Fn {
    Sin, Cos, Tan, Asin, Acos, Atan,
    Sqrt, Log, Log10, Exp,
    Abs, Fabs, Floor, Ceil, Round,
    Min, Max, Pow
};

namespace {

struct FnEntry {
    const char* name;
    Fn fn;
};

const FnEntry kFunctions[] = {
    {"sin", Fn::Sin},     {"cos", Fn::Cos},     {"tan", Fn::Tan},
    {"asin", Fn::Asin},   {"acos", Fn::Acos},   {"atan", Fn::Atan},
    {"sqrt", Fn::Sqrt},   {"log", Fn::Log},     {"log10", Fn::Log10},
    {"exp", Fn::Exp},     {"abs", Fn::Abs},     {"fabs", Fn::Fabs},
    {"floor", Fn::Floor}, {"ceil", Fn::Ceil},   {"round", Fn::Round},
    {"min", Fn::Min},     {"max", Fn::Max},     {"pow", Fn::Pow},
};

bool lookup_function(const std::string& name, Fn& out) {
    for (const auto& e : kFunctions) {
        if (name == e.name) {
            out = e.fn;
            return true;
        }
    }
    return false;
}

// Python keywords that can never appear in a calibration expression.
const char* const kForbiddenKeywords[] = {
    "not", "lambda", "import", "from", "for", "in", "is", "while", "def", "class",
    "return", "yield", "await", "async", "del", "global", "nonlocal", "with", "as",
    "assert", "pass", "raise", "try", "except", "finally", "elif", "break", "continue",
    "None", "True", "False",
};

bool is_forbidden_keyword(const std::string& name) {
    for (const char* k : kForbiddenKeywords) {
        if (name == k) return true;
    }
    return false;
}

constexpr int kMaxDepth = 100;
constexpr int kMaxNodes = 1000;

} // namespace

bool is_calibration_function(const std::string& name) {
    Fn fn;
    return lookup_function(name, fn);
}

double round_half_away(double v, int digits) {
    if (!std::isfinite(v)) return v;
    if (digits >= 0) {
        if (digits > 22) return v;
        const double scale = std::pow(10.0, digits);
        const double scaled = v * scale;
        // Already integral at this precision.
        if (!std::isfinite(scaled) || std::fabs(scaled) >= 4503599627370496.0) return v;
        return std::round(scaled) / scale;
    }
    if (digits < -308) return std::copysign(0.0, v);
    const double scale = std::pow(10.0, -digits);
    return std::round(v / scale) * scale;
}

// ------------------ tree ------------------
enum class BinOp { Add, Sub, Mul, Div, FloorDiv, Mod, Pow };
enum class CmpOp { Eq, Ne, Lt, Le, Gt, Ge };

struct CalibExpr::Node {
    enum class Kind { Number, String, Raw, Neg, Pos, Binary, Compare, And, Or, Cond, Call };

    Kind kind = Kind::Number;
    double number = 0.0;
    std::string str;                   // string literal, or function name for Call
    BinOp bin = BinOp::Add;
    Fn fn = Fn::Sin;
    std::vector<CmpOp> cmps;           // Compare: kids.size() == cmps.size() + 1
    std::vector<std::unique_ptr<Node>> kids;
};

using NodePtr = std::unique_ptr<CalibExpr::Node>;
using Kind = CalibExpr::Node::Kind;

// ------------------ tokenizer ------------------
namespace {

enum class Tok { Num, Str, Name, Op, End };

struct Token {
    Tok kind = Tok::End;
    std::string text;
    double num = 0.0;
    size_t pos = 0;
};

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        while (true) {
            skip_space();
            Token t;
            t.pos = i_;
            if (i_ >= src_.size()) {
                t.kind = Tok::End;
                out.push_back(t);
                return out;
            }
            const char c = src_[i_];
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && i_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_ + 1])))) {
                t.kind = Tok::Num;
                t.num = number();
            } else if (c == '\'' || c == '"') {
                t.kind = Tok::Str;
                t.text = string_literal();
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                t.kind = Tok::Name;
                while (i_ < src_.size() &&
                       (std::isalnum(static_cast<unsigned char>(src_[i_])) || src_[i_] == '_')) {
                    t.text += src_[i_++];
                }
            } else {
                t.kind = Tok::Op;
                t.text = op();
            }
            out.push_back(std::move(t));
        }
    }

private:
    [[noreturn]] void fail(const std::string& cause) const { throw ExpressionError(src_, cause); }

    void skip_space() {
        while (i_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[i_]))) ++i_;
    }

    bool starts(const char* s) const { return src_.compare(i_, std::char_traits<char>::length(s), s) == 0; }

    double number() {
        const size_t start = i_;
        double v = 0.0;
        if (starts("0x") || starts("0X")) {
            i_ += 2;
            const size_t digits = i_;
            while (i_ < src_.size() && std::isxdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
            if (i_ == digits) fail("invalid hexadecimal literal at position " + std::to_string(start));
            v = static_cast<double>(std::strtoull(src_.substr(digits, i_ - digits).c_str(), nullptr, 16));
        } else {
            while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
            if (i_ < src_.size() && src_[i_] == '.') {
                ++i_;
                while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
            }
            if (i_ < src_.size() && (src_[i_] == 'e' || src_[i_] == 'E')) {
                size_t j = i_ + 1;
                if (j < src_.size() && (src_[j] == '+' || src_[j] == '-')) ++j;
                if (j < src_.size() && std::isdigit(static_cast<unsigned char>(src_[j]))) {
                    i_ = j;
                    while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
                }
            }
            v = std::strtod(src_.substr(start, i_ - start).c_str(), nullptr);
        }
        if (i_ < src_.size() && (std::isalnum(static_cast<unsigned char>(src_[i_])) || src_[i_] == '_')) {
            fail("invalid number literal at position " + std::to_string(start));
        }
        return v;
    }

    std::string string_literal() {
        const char quote = src_[i_++];
        std::string out;
        while (i_ < src_.size() && src_[i_] != quote) {
            char c = src_[i_++];
            if (c == '\\' && i_ < src_.size()) {
                const char e = src_[i_++];
                switch (e) {
                    case 'n': c = '\n'; break;
                    case 't': c = '\t'; break;
                    case '\\': c = '\\'; break;
                    case '\'': c = '\''; break;
                    case '"': c = '"'; break;
                    default: out += '\\'; c = e; break;
                }
            }
            out += c;
        }
        if (i_ >= src_.size()) fail("unterminated string literal");
        ++i_;
        return out;
    }

    std::string op() {
        static const char* kOps[] = {"**", "//", "==", "!=", "<=", ">=",
                                     "+", "-", "*", "/", "%", "<", ">", "(", ")", ",", "."};
        if (starts(":=")) fail("assignment expressions are not allowed");
        if (starts("<<") || starts(">>")) fail("Disallowed binary operator '" + src_.substr(i_, 2) + "'");
        for (const char* o : kOps) {
            if (starts(o)) {
                i_ += std::char_traits<char>::length(o);
                return o;
            }
        }
        const char c = src_[i_];
        switch (c) {
            case '=': fail("assignment is not allowed");
            case '[':
            case ']': fail("subscripts and list displays are not allowed");
            case '{':
            case '}': fail("dict and set displays are not allowed");
            case ';': fail("multiple statements are not allowed");
            case '&':
            case '|':
            case '^':
            case '@': fail(std::string("Disallowed binary operator '") + c + "'");
            case '~': fail("Disallowed unary operator '~'");
            default: break;
        }
        fail(std::string("unexpected character '") + c + "' at position " + std::to_string(i_));
    }

    const std::string& src_;
    size_t i_ = 0;
};

// ------------------ parser ------------------
class Parser {
public:
    Parser(const std::string& src, std::vector<Token> toks) : src_(src), toks_(std::move(toks)) {}

    NodePtr run() {
        NodePtr n = expr();
        if (peek().kind != Tok::End) unexpected();
        return n;
    }

private:
    [[noreturn]] void fail(const std::string& cause) const { throw ExpressionError(src_, cause); }

    [[noreturn]] void unexpected() const {
        const Token& t = peek();
        if (t.kind == Tok::End) fail("unexpected end of expression");
        if (t.kind == Tok::Name && is_forbidden_keyword(t.text)) {
            fail("Disallowed expression element '" + t.text + "'");
        }
        fail("invalid syntax at position " + std::to_string(t.pos));
    }

    const Token& peek() const { return toks_[i_]; }
    Token next() { return toks_[i_ < toks_.size() - 1 ? i_++ : i_]; }

    bool is_op(const char* o) const { return peek().kind == Tok::Op && peek().text == o; }
    bool is_kw(const char* k) const { return peek().kind == Tok::Name && peek().text == k; }

    void expect_op(const char* o) {
        if (!is_op(o)) unexpected();
        next();
    }

    struct DepthGuard {
        explicit DepthGuard(Parser& p) : p_(p) {
            if (++p_.depth_ > kMaxDepth) p_.fail("expression is nested too deeply");
        }
        ~DepthGuard() { --p_.depth_; }
        Parser& p_;
    };

    NodePtr make(Kind k) {
        if (++nodes_ > kMaxNodes) fail("expression is too long");
        auto n = std::make_unique<CalibExpr::Node>();
        n->kind = k;
        return n;
    }

    NodePtr expr() {
        NodePtr body = or_test();
        if (!is_kw("if")) return body;
        next();
        NodePtr cond = or_test();
        if (!is_kw("else")) fail("conditional expression is missing 'else'");
        next();
        DepthGuard g(*this);
        NodePtr orelse = expr();
        NodePtr n = make(Kind::Cond);
        n->kids.push_back(std::move(cond));
        n->kids.push_back(std::move(body));
        n->kids.push_back(std::move(orelse));
        return n;
    }

    NodePtr or_test() {
        NodePtr first = and_test();
        if (!is_kw("or")) return first;
        NodePtr n = make(Kind::Or);
        n->kids.push_back(std::move(first));
        while (is_kw("or")) {
            next();
            n->kids.push_back(and_test());
        }
        return n;
    }

    NodePtr and_test() {
        if (is_kw("not")) fail("Disallowed unary operator 'not'");
        NodePtr first = comparison();
        if (!is_kw("and")) return first;
        NodePtr n = make(Kind::And);
        n->kids.push_back(std::move(first));
        while (is_kw("and")) {
            next();
            if (is_kw("not")) fail("Disallowed unary operator 'not'");
            n->kids.push_back(comparison());
        }
        return n;
    }

    bool comparison_op(CmpOp& out) const {
        if (is_kw("in") || is_kw("is") || is_kw("not")) {
            fail("Disallowed comparison operator '" + peek().text + "'");
        }
        if (peek().kind != Tok::Op) return false;
        const std::string& t = peek().text;
        if (t == "==") out = CmpOp::Eq;
        else if (t == "!=") out = CmpOp::Ne;
        else if (t == "<") out = CmpOp::Lt;
        else if (t == "<=") out = CmpOp::Le;
        else if (t == ">") out = CmpOp::Gt;
        else if (t == ">=") out = CmpOp::Ge;
        else return false;
        return true;
    }

    NodePtr comparison() {
        NodePtr first = arith();
        CmpOp op;
        if (!comparison_op(op)) return first;
        NodePtr n = make(Kind::Compare);
        n->kids.push_back(std::move(first));
        while (comparison_op(op)) {
            next();
            n->cmps.push_back(op);
            n->kids.push_back(arith());
        }
        return n;
    }

    NodePtr binary(BinOp op, NodePtr lhs, NodePtr rhs) {
        NodePtr n = make(Kind::Binary);
        n->bin = op;
        n->kids.push_back(std::move(lhs));
        n->kids.push_back(std::move(rhs));
        return n;
    }

    NodePtr arith() {
        NodePtr lhs = term();
        while (is_op("+") || is_op("-")) {
            const BinOp op = next().text == "+" ? BinOp::Add : BinOp::Sub;
            lhs = binary(op, std::move(lhs), term());
        }
        return lhs;
    }

    NodePtr term() {
        NodePtr lhs = factor();
        while (is_op("*") || is_op("/") || is_op("//") || is_op("%")) {
            const std::string t = next().text;
            const BinOp op = t == "*" ? BinOp::Mul : t == "/" ? BinOp::Div
                           : t == "//" ? BinOp::FloorDiv : BinOp::Mod;
            lhs = binary(op, std::move(lhs), factor());
        }
        return lhs;
    }

    NodePtr factor() {
        if (is_op("+") || is_op("-")) {
            DepthGuard g(*this);
            const bool neg = next().text == "-";
            NodePtr n = make(neg ? Kind::Neg : Kind::Pos);
            n->kids.push_back(factor());
            return n;
        }
        return power();
    }

    // '**' binds tighter than a unary minus on its left and is right-associative.
    NodePtr power() {
        NodePtr base = atom();
        if (!is_op("**")) return base;
        next();
        DepthGuard g(*this);
        return binary(BinOp::Pow, std::move(base), factor());
    }

    NodePtr call(Fn fn, const std::string& name) {
        DepthGuard g(*this);
        expect_op("(");
        NodePtr n = make(Kind::Call);
        n->fn = fn;
        n->str = name;
        if (!is_op(")")) {
            n->kids.push_back(expr());
            while (is_op(",")) {
                next();
                if (is_op(")")) break;
                n->kids.push_back(expr());
            }
        }
        expect_op(")");
        return n;
    }

    NodePtr name_atom() {
        const Token t = next();
        const std::string& name = t.text;

        if (is_forbidden_keyword(name) || name == "if" || name == "else" ||
            name == "and" || name == "or") {
            fail("Disallowed expression element '" + name + "'");
        }
        if (name == "math") {
            if (!is_op(".")) fail("Only math.<func> calls are allowed.");
            next();
            if (peek().kind != Tok::Name) fail("Only math.<func> calls are allowed.");
            const std::string attr = next().text;
            Fn fn;
            if (!lookup_function(attr, fn)) fail("Function 'math." + attr + "' not allowed.");
            if (!is_op("(")) fail("Only math.<func> calls are allowed.");
            return call(fn, attr);
        }
        if (is_op("(")) {
            Fn fn;
            if (!lookup_function(name, fn)) fail("Function '" + name + "' not allowed.");
            return call(fn, name);
        }
        if (name == "raw") return make(Kind::Raw);
        fail("Unknown variable '" + name + "'. Allowed: ['raw']");
    }

    NodePtr atom() {
        NodePtr n;
        const Token& t = peek();
        switch (t.kind) {
            case Tok::Num:
                n = make(Kind::Number);
                n->number = next().num;
                break;
            case Tok::Str:
                n = make(Kind::String);
                n->str = next().text;
                break;
            case Tok::Name:
                n = name_atom();
                break;
            case Tok::Op:
                if (t.text != "(") unexpected();
                next();
                if (is_op(")")) fail("tuples are not allowed");
                {
                    DepthGuard g(*this);
                    n = expr();
                }
                if (is_op(",")) fail("tuples are not allowed");
                expect_op(")");
                break;
            case Tok::End:
                unexpected();
        }
        // Trailers on anything but a bare allow-listed call are rejected.
        if (is_op(".")) fail("attribute access is only allowed as math.<func>");
        if (is_op("(")) fail("Only simple function calls are allowed.");
        return n;
    }

    const std::string& src_;
    std::vector<Token> toks_;
    size_t i_ = 0;
    int depth_ = 0;
    int nodes_ = 0;
};

// ------------------ evaluator ------------------
struct Val {
    bool is_str = false;
    double num = 0.0;
    std::string str;
};

Val num_val(double d) {
    Val v;
    v.num = d;
    return v;
}

const char* type_name(const Val& v) { return v.is_str ? "str" : "float"; }

bool truthy(const Val& v) { return v.is_str ? !v.str.empty() : v.num != 0.0; }

class Evaluator {
public:
    Evaluator(const std::string& src, double raw) : src_(src), raw_(raw) {}

    Val eval(const CalibExpr::Node& n) {
        switch (n.kind) {
            case Kind::Number: return num_val(n.number);
            case Kind::String: {
                Val v;
                v.is_str = true;
                v.str = n.str;
                return v;
            }
            case Kind::Raw: return num_val(raw_);
            case Kind::Neg: return num_val(-number(eval(*n.kids[0]), "bad operand type for unary -"));
            case Kind::Pos: return num_val(number(eval(*n.kids[0]), "bad operand type for unary +"));
            case Kind::Binary: return binary(n.bin, eval(*n.kids[0]), eval(*n.kids[1]));
            case Kind::Compare: {
                Val lhs = eval(*n.kids[0]);
                for (size_t i = 0; i < n.cmps.size(); ++i) {
                    Val rhs = eval(*n.kids[i + 1]);
                    if (!compare(n.cmps[i], lhs, rhs)) return num_val(0.0);
                    lhs = std::move(rhs);
                }
                return num_val(1.0);
            }
            case Kind::And: {
                Val v;
                for (const auto& k : n.kids) {
                    v = eval(*k);
                    if (!truthy(v)) return v;
                }
                return v;
            }
            case Kind::Or: {
                Val v;
                for (const auto& k : n.kids) {
                    v = eval(*k);
                    if (truthy(v)) return v;
                }
                return v;
            }
            case Kind::Cond:
                return truthy(eval(*n.kids[0])) ? eval(*n.kids[1]) : eval(*n.kids[2]);
            case Kind::Call: return num_val(call(n));
        }
        fail("unsupported expression node");
    }

    [[noreturn]] void fail(const std::string& cause) const { throw ExpressionError(src_, cause); }

private:
    double number(const Val& v, const std::string& what) const {
        if (v.is_str) fail(what + ": 'str'");
        return v.num;
    }

    static const char* op_symbol(BinOp op) {
        switch (op) {
            case BinOp::Add: return "+";
            case BinOp::Sub: return "-";
            case BinOp::Mul: return "*";
            case BinOp::Div: return "/";
            case BinOp::FloorDiv: return "//";
            case BinOp::Mod: return "%";
            case BinOp::Pow: return "**";
        }
        return "?";
    }

    Val binary(BinOp op, const Val& a, const Val& b) const {
        if (a.is_str || b.is_str) {
            if (op == BinOp::Add && a.is_str && b.is_str) {
                Val v;
                v.is_str = true;
                v.str = a.str + b.str;
                return v;
            }
            fail(std::string("unsupported operand type(s) for ") + op_symbol(op) + ": '" +
                 type_name(a) + "' and '" + type_name(b) + "'");
        }
        const double x = a.num;
        const double y = b.num;
        switch (op) {
            case BinOp::Add: return num_val(x + y);
            case BinOp::Sub: return num_val(x - y);
            case BinOp::Mul: return num_val(x * y);
            case BinOp::Div:
                if (y == 0.0) fail("float division by zero");
                return num_val(x / y);
            case BinOp::FloorDiv:
                if (y == 0.0) fail("float floor division by zero");
                return num_val(std::floor(x / y));
            case BinOp::Mod: {
                if (y == 0.0) fail("float modulo");
                double r = std::fmod(x, y);
                // Result takes the sign of the divisor.
                if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
                return num_val(r);
            }
            case BinOp::Pow: return num_val(power(x, y));
        }
        fail("unsupported operator");
    }

    double power(double x, double y) const {
        if (x == 0.0 && y < 0.0) fail("0.0 cannot be raised to a negative power");
        if (x < 0.0 && std::isfinite(y) && std::floor(y) != y) {
            fail("negative number cannot be raised to a fractional power");
        }
        const double r = std::pow(x, y);
        if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) fail("math range error");
        return r;
    }

    bool compare(CmpOp op, const Val& a, const Val& b) const {
        if (a.is_str != b.is_str) {
            if (op == CmpOp::Eq) return false;
            if (op == CmpOp::Ne) return true;
            fail(std::string("comparison not supported between instances of '") +
                 type_name(a) + "' and '" + type_name(b) + "'");
        }
        if (a.is_str) {
            const int c = a.str.compare(b.str);
            switch (op) {
                case CmpOp::Eq: return c == 0;
                case CmpOp::Ne: return c != 0;
                case CmpOp::Lt: return c < 0;
                case CmpOp::Le: return c <= 0;
                case CmpOp::Gt: return c > 0;
                case CmpOp::Ge: return c >= 0;
            }
        }
        switch (op) {
            case CmpOp::Eq: return a.num == b.num;
            case CmpOp::Ne: return a.num != b.num;
            case CmpOp::Lt: return a.num < b.num;
            case CmpOp::Le: return a.num <= b.num;
            case CmpOp::Gt: return a.num > b.num;
            case CmpOp::Ge: return a.num >= b.num;
        }
        return false;
    }

    void arity(const CalibExpr::Node& n, size_t lo, size_t hi) const {
        const size_t got = n.kids.size();
        if (got >= lo && got <= hi) return;
        std::ostringstream os;
        os << n.str << "() takes ";
        if (lo == hi) os << "exactly " << lo;
        else if (hi == static_cast<size_t>(-1)) os << "at least " << lo;
        else os << "from " << lo << " to " << hi;
        os << " argument" << (hi == 1 ? "" : "s") << " (" << got << " given)";
        fail(os.str());
    }

    // Unary math function with Python's error conventions.
    double checked(double x, double r) const {
        if (std::isnan(r) && !std::isnan(x)) fail("math domain error");
        if (std::isinf(r) && std::isfinite(x)) fail("math range error");
        return r;
    }

    double integral(double x, const char* what) const {
        if (std::isnan(x)) fail(std::string("cannot convert float NaN to integer in ") + what + "()");
        if (std::isinf(x)) fail(std::string("cannot convert float infinity to integer in ") + what + "()");
        return x;
    }

    double call(const CalibExpr::Node& n) {
        std::vector<double> args;
        args.reserve(n.kids.size());
        for (const auto& k : n.kids) {
            args.push_back(number(eval(*k), "must be real number, not"));
        }

        switch (n.fn) {
            case Fn::Sin: arity(n, 1, 1); return checked(args[0], std::sin(args[0]));
            case Fn::Cos: arity(n, 1, 1); return checked(args[0], std::cos(args[0]));
            case Fn::Tan: arity(n, 1, 1); return checked(args[0], std::tan(args[0]));
            case Fn::Asin: arity(n, 1, 1); return checked(args[0], std::asin(args[0]));
            case Fn::Acos: arity(n, 1, 1); return checked(args[0], std::acos(args[0]));
            case Fn::Atan: arity(n, 1, 1); return checked(args[0], std::atan(args[0]));
            case Fn::Sqrt:
                arity(n, 1, 1);
                if (args[0] < 0.0) fail("math domain error");
                return std::sqrt(args[0]);
            case Fn::Log: {
                arity(n, 1, 2);
                if (args[0] <= 0.0) fail("math domain error");
                double r = std::log(args[0]);
                if (args.size() == 2) {
                    if (args[1] <= 0.0) fail("math domain error");
                    const double base = std::log(args[1]);
                    if (base == 0.0) fail("float division by zero");
                    r /= base;
                }
                return r;
            }
            case Fn::Log10:
                arity(n, 1, 1);
                if (args[0] <= 0.0) fail("math domain error");
                return std::log10(args[0]);
            case Fn::Exp: arity(n, 1, 1); return checked(args[0], std::exp(args[0]));
            case Fn::Abs:
            case Fn::Fabs: arity(n, 1, 1); return std::fabs(args[0]);
            case Fn::Floor: arity(n, 1, 1); return std::floor(integral(args[0], "floor"));
            case Fn::Ceil: arity(n, 1, 1); return std::ceil(integral(args[0], "ceil"));
            case Fn::Round: {
                arity(n, 1, 2);
                if (args.size() == 1) return std::round(integral(args[0], "round"));
                integral(args[1], "round");
                if (std::floor(args[1]) != args[1]) {
                    fail("'float' object cannot be interpreted as an integer");
                }
                if (args[1] < std::numeric_limits<int>::min() || args[1] > std::numeric_limits<int>::max()) {
                    fail("round() ndigits out of range");
                }
                return round_half_away(args[0], static_cast<int>(args[1]));
            }
            case Fn::Min:
            case Fn::Max: {
                arity(n, 2, static_cast<size_t>(-1));
                double r = args[0];
                for (size_t i = 1; i < args.size(); ++i) {
                    if (n.fn == Fn::Min ? args[i] < r : args[i] > r) r = args[i];
                }
                return r;
            }
            case Fn::Pow: arity(n, 2, 2); return power(args[0], args[1]);
        }
        fail("Function '" + n.str + "' not allowed.");
    }

    const std::string& src_;
    double raw_;
};

double coerce_to_float(const Val& v, const Evaluator& ev) {
    if (!v.is_str) return v.num;
    size_t b = v.str.find_first_not_of(" \t\r\n");
    size_t e = v.str.find_last_not_of(" \t\r\n");
    const std::string t = b == std::string::npos ? std::string() : v.str.substr(b, e - b + 1);
    char* end = nullptr;
    const double d = t.empty() ? 0.0 : std::strtod(t.c_str(), &end);
    if (t.empty() || end != t.c_str() + t.size()) {
        ev.fail("could not convert string to float: '" + v.str + "'");
    }
    return d;
}

} // namespace

// ------------------ CalibExpr ------------------
CalibExpr::CalibExpr(std::string text, std::shared_ptr<const Node> root)
    : text_(std::move(text)), root_(std::move(root)) {}

CalibExpr CalibExpr::parse(const std::string& text) {
    Lexer lexer(text);
    Parser parser(text, lexer.run());
    NodePtr root = parser.run();
    return CalibExpr(text, std::shared_ptr<const Node>(std::move(root)));
}

double CalibExpr::evaluate(double raw) const {
    Evaluator ev(text_, raw);
    return coerce_to_float(ev.eval(*root_), ev);
}

double eval_expr(const std::string& expr, double raw) {
    return CalibExpr::parse(expr).evaluate(raw);
}

} // namespace satr
