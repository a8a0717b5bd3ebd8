#include "cellexpr/ast.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace cellexpr {

int binding_power(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:     return PowEq;
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:     return PowCmp;
        case BinaryOp::Concat: return PowConcat;
        case BinaryOp::Add:
        case BinaryOp::Sub:    return PowAdd;
        case BinaryOp::Mul:
        case BinaryOp::Div:    return PowMul;
        case BinaryOp::Pow:    return PowPow;
    }
    return PowLowest;
}

bool is_comparison(BinaryOp op) {
    return binding_power(op) == PowEq || binding_power(op) == PowCmp;
}

const char* symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:    return "+";
        case BinaryOp::Sub:    return "-";
        case BinaryOp::Mul:    return "*";
        case BinaryOp::Div:    return "/";
        case BinaryOp::Pow:    return "^";
        case BinaryOp::Concat: return "&";
        case BinaryOp::Eq:     return "=";
        case BinaryOp::Ne:     return "<>";
        case BinaryOp::Lt:     return "<";
        case BinaryOp::Le:     return "<=";
        case BinaryOp::Gt:     return ">";
        case BinaryOp::Ge:     return ">=";
    }
    return "?";
}

const char* symbol(UnaryOp op) {
    return op == UnaryOp::Minus ? "-" : "+";
}

ExprPtr make_identifier(std::string name) {
    return std::make_unique<Expr>(Expr{Identifier{std::move(name)}});
}
ExprPtr make_number(double v) {
    return std::make_unique<Expr>(Expr{NumberLit{v}});
}
ExprPtr make_text(std::string v) {
    return std::make_unique<Expr>(Expr{TextLit{std::move(v)}});
}
ExprPtr make_unary(UnaryOp op, ExprPtr operand) {
    return std::make_unique<Expr>(Expr{Unary{op, std::move(operand)}});
}
ExprPtr make_binary(BinaryOp op, ExprPtr left, ExprPtr right) {
    return std::make_unique<Expr>(Expr{Binary{op, std::move(left), std::move(right)}});
}
ExprPtr make_call(ExprPtr callee, std::vector<ExprPtr> args) {
    return std::make_unique<Expr>(Expr{Call{std::move(callee), std::move(args)}});
}
ExprPtr make_cell(Position pos) {
    return std::make_unique<Expr>(Expr{CellRef{std::move(pos)}});
}
ExprPtr make_range(Position start, Position end) {
    return std::make_unique<Expr>(Expr{RangeRef{CellRef{std::move(start)}, CellRef{std::move(end)}}});
}

// -----------------------------
// rendering
// -----------------------------
static std::string number_text(double v) {
    std::ostringstream os;
    os << std::setprecision(15) << v;
    return os.str();
}

static bool needs_quotes(const std::string& sheet) {
    for (char c : sheet) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return true;
    }
    return false;
}

static std::string cell_text(const Position& p, bool with_sheet) {
    Position bare = p;
    bare.sheet.clear();
    if (!with_sheet || p.sheet.empty()) return encode(bare);
    std::string sheet = needs_quotes(p.sheet) ? "'" + p.sheet + "'" : p.sheet;
    return sheet + "!" + encode(bare);
}

// A reference moved above row 1 or left of column A.
static bool off_sheet(const Position& p) {
    return p.row < 1 || p.column < 1;
}

static std::string ref_text(const Position& p, bool with_sheet) {
    return off_sheet(p) ? "#REF!" : cell_text(p, with_sheet);
}

static int power_of(const Expr& e) {
    if (auto b = e.as<Binary>()) return binding_power(b->op);
    if (e.as<Unary>()) return PowUnary;
    return PowCall;
}

static std::string operand_text(const Expr& e, bool parens) {
    std::string s = to_string(e);
    return parens ? "(" + s + ")" : s;
}

std::string to_string(const Expr& e) {
    return std::visit([&](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Identifier>) {
            return n.name;
        } else if constexpr (std::is_same_v<T, NumberLit>) {
            return number_text(n.value);
        } else if constexpr (std::is_same_v<T, TextLit>) {
            char q = n.value.find('"') == std::string::npos ? '"' : '\'';
            return q + n.value + q;
        } else if constexpr (std::is_same_v<T, Unary>) {
            return std::string(symbol(n.op)) + operand_text(*n.operand, power_of(*n.operand) < PowUnary);
        } else if constexpr (std::is_same_v<T, Binary>) {
            int pow = binding_power(n.op);
            bool right_assoc = n.op == BinaryOp::Pow;
            int lp = power_of(*n.left);
            int rp = power_of(*n.right);
            bool lparen = lp < pow || (right_assoc && lp == pow);
            bool rparen = rp < pow || (!right_assoc && rp == pow);
            return operand_text(*n.left, lparen) + " " + symbol(n.op) + " " + operand_text(*n.right, rparen);
        } else if constexpr (std::is_same_v<T, Call>) {
            std::string out = to_string(*n.callee) + "(";
            for (std::size_t i = 0; i < n.args.size(); ++i) {
                if (i) out += ", ";
                out += to_string(*n.args[i]);
            }
            return out + ")";
        } else if constexpr (std::is_same_v<T, CellRef>) {
            return ref_text(n.pos, true);
        } else {
            if (off_sheet(n.start.pos) || off_sheet(n.end.pos)) return "#REF!";
            return cell_text(n.start.pos, true) + ":" + cell_text(n.end.pos, n.end.pos.sheet != n.start.pos.sheet);
        }
    }, e.node);
}

static const char* bool_text(bool b) { return b ? "true" : "false"; }

static std::string dump_cell(const CellRef& c) {
    Position bare = c.pos;
    bare.absolute_column = false;
    bare.absolute_row = false;
    return "cell(" + encode(bare) + ", " + bool_text(c.pos.absolute_column) + ", " +
           bool_text(c.pos.absolute_row) + ")";
}

std::string dump(const Expr& e) {
    return std::visit([&](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Identifier>) {
            return "identifier(" + n.name + ")";
        } else if constexpr (std::is_same_v<T, NumberLit>) {
            return "number(" + number_text(n.value) + ")";
        } else if constexpr (std::is_same_v<T, TextLit>) {
            return "literal(" + n.value + ")";
        } else if constexpr (std::is_same_v<T, Unary>) {
            return "unary(" + dump(*n.operand) + ", " + symbol(n.op) + ")";
        } else if constexpr (std::is_same_v<T, Binary>) {
            return "binary(" + dump(*n.left) + ", " + dump(*n.right) + ", " + symbol(n.op) + ")";
        } else if constexpr (std::is_same_v<T, Call>) {
            std::string out = "call(" + dump(*n.callee) + ", args: ";
            for (std::size_t i = 0; i < n.args.size(); ++i) {
                if (i) out += ", ";
                out += dump(*n.args[i]);
            }
            return out + ")";
        } else if constexpr (std::is_same_v<T, CellRef>) {
            return dump_cell(n);
        } else {
            return "range(" + dump_cell(n.start) + ", " + dump_cell(n.end) + ")";
        }
    }, e.node);
}

// -----------------------------
// cloning
// -----------------------------
ExprPtr clone_with_offset(const Expr& e, std::int64_t delta_row, std::int64_t delta_column) {
    return std::visit([&](const auto& n) -> ExprPtr {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Identifier>) {
            return make_identifier(n.name);
        } else if constexpr (std::is_same_v<T, NumberLit>) {
            return make_number(n.value);
        } else if constexpr (std::is_same_v<T, TextLit>) {
            return make_text(n.value);
        } else if constexpr (std::is_same_v<T, Unary>) {
            return make_unary(n.op, clone_with_offset(*n.operand, delta_row, delta_column));
        } else if constexpr (std::is_same_v<T, Binary>) {
            return make_binary(n.op,
                               clone_with_offset(*n.left, delta_row, delta_column),
                               clone_with_offset(*n.right, delta_row, delta_column));
        } else if constexpr (std::is_same_v<T, Call>) {
            std::vector<ExprPtr> args;
            args.reserve(n.args.size());
            for (const auto& a : n.args) args.push_back(clone_with_offset(*a, delta_row, delta_column));
            // the callee is a name, never relocated
            return make_call(clone(*n.callee), std::move(args));
        } else if constexpr (std::is_same_v<T, CellRef>) {
            return make_cell(offset(n.pos, delta_row, delta_column));
        } else {
            return make_range(offset(n.start.pos, delta_row, delta_column),
                              offset(n.end.pos, delta_row, delta_column));
        }
    }, e.node);
}

ExprPtr clone(const Expr& e) {
    return clone_with_offset(e, 0, 0);
}

} // namespace cellexpr
