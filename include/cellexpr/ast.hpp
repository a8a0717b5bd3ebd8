#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "cellexpr/address.hpp"

namespace cellexpr {

enum class UnaryOp { Plus, Minus };

enum class BinaryOp {
    Add, Sub, Mul, Div, Pow,
    Concat,
    Eq, Ne, Lt, Le, Gt, Ge,
};

// Binding powers, low to high.
enum Power : int {
    PowLowest = 0,
    PowEq,
    PowCmp,
    PowConcat,
    PowAdd,
    PowMul,
    PowPow,
    PowUnary,
    PowCall,
};

int binding_power(BinaryOp op);
bool is_comparison(BinaryOp op);
const char* symbol(BinaryOp op);
const char* symbol(UnaryOp op);

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Identifier { std::string name; };
struct NumberLit  { double value{0.0}; };
struct TextLit    { std::string value; };
struct Unary      { UnaryOp op{UnaryOp::Plus}; ExprPtr operand; };
struct Binary     { BinaryOp op{BinaryOp::Add}; ExprPtr left; ExprPtr right; };
struct Call       { ExprPtr callee; std::vector<ExprPtr> args; };
struct CellRef    { Position pos; };
struct RangeRef   { CellRef start; CellRef end; };

using ExprNode = std::variant<Identifier, NumberLit, TextLit, Unary, Binary, Call, CellRef, RangeRef>;

/// Immutable once built by the parser; owned by whoever parsed it.
struct Expr {
    ExprNode node;

    template <class T>
    const T* as() const { return std::get_if<T>(&node); }
};

ExprPtr make_identifier(std::string name);
ExprPtr make_number(double v);
ExprPtr make_text(std::string v);
ExprPtr make_unary(UnaryOp op, ExprPtr operand);
ExprPtr make_binary(BinaryOp op, ExprPtr left, ExprPtr right);
ExprPtr make_call(ExprPtr callee, std::vector<ExprPtr> args);
ExprPtr make_cell(Position pos);
ExprPtr make_range(Position start, Position end);

/// Formula text for `e` ("A1 + 2 * B$3").
std::string to_string(const Expr& e);

/// Structural dump used by tests and debugging:
/// "binary(number(1), number(2), +)".
std::string dump(const Expr& e);

ExprPtr clone(const Expr& e);

/// Deep copy with every relative reference moved by the given delta, as when
/// a formula is copied to another cell. Absolute components stay put.
ExprPtr clone_with_offset(const Expr& e, std::int64_t delta_row, std::int64_t delta_column);

} // namespace cellexpr
