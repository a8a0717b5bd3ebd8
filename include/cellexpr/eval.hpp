#pragma once
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "cellexpr/ast.hpp"
#include "cellexpr/context.hpp"
#include "cellexpr/value.hpp"

namespace cellexpr {

/// Evaluate `e` against `ctx`. In-language failures come back as Error
/// values; structural ones (undefined names, missing cells, cycles) throw
/// EvalError.
Value evaluate(const Expr& e, Context& ctx);

/// Comparison as the evaluator does it; nullopt when the operands are
/// not comparable. `op` must be a comparison operator.
std::optional<bool> compare(BinaryOp op, const Value& a, const Value& b);

/// Cell filter used by reducers. Without an operator every cell passes.
struct Predicate {
    std::optional<BinaryOp> op{};
    Value operand{};

    bool test(const Value& v) const;
};

/// A call argument: an unevaluated expression or an already computed value.
class Argument {
public:
    explicit Argument(const Expr& e) : arg_(&e) {}
    explicit Argument(Value v) : arg_(std::move(v)) {}

    Value eval(Context& ctx) const;

    /// For a comparison expression ("A1:A9 > 2") the evaluated left side
    /// and a predicate built from the operator and the evaluated right side.
    std::optional<std::pair<Value, Predicate>> try_as_predicate(Context& ctx) const;

private:
    std::variant<const Expr*, Value> arg_;
};

class FunctionValue {
public:
    virtual ~FunctionValue() = default;

    virtual const std::string& name() const = 0;
    virtual Value call(const std::vector<Argument>& args, Context& ctx) const = 0;
};

using DirectFn = std::function<Value(const std::vector<Value>& args)>;
/// Receives the flattened source cells and the predicate to apply.
using ReduceFn = std::function<Value(const std::vector<Value>& cells, const Predicate& pred)>;

/// Evaluates every argument, then calls fn. A wrong argument count
/// yields #VALUE!.
FunctionPtr make_function(std::string name, DirectFn fn, std::size_t min_args = 0,
                          std::size_t max_args = std::numeric_limits<std::size_t>::max());

/// fn(A1:A9 > 2) filters with "> 2"; fn(A1:A9, 2) filters with "= 2";
/// fn(A1:A9) lets every cell through.
FunctionPtr make_reducer(std::string name, ReduceFn fn);

} // namespace cellexpr
