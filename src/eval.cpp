#include "cellexpr/eval.hpp"
#include "cellexpr/errors.hpp"

#include <cmath>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace cellexpr {

std::optional<bool> compare(BinaryOp op, const Value& a, const Value& b) {
    auto eq = equal(a, b);
    auto ls = less(a, b);
    if (!eq || !ls) return std::nullopt;
    switch (op) {
        case BinaryOp::Eq: return *eq;
        case BinaryOp::Ne: return !*eq;
        case BinaryOp::Lt: return *ls;
        case BinaryOp::Le: return *eq || *ls;
        case BinaryOp::Gt: return !*eq && !*ls;
        case BinaryOp::Ge: return *eq || !*ls;
        default:           return std::nullopt;
    }
}

// -----------------------------
// operators
// -----------------------------
static Value numeric(const Value& v) {
    Value n = to_number(v);
    return is_error(n) ? Value::error(ErrorCode::Value) : n;
}

static Value checked(double d) {
    return std::isfinite(d) ? Value::number(d) : Value::error(ErrorCode::Num);
}

// Sign operators take numbers only.
static Value scalar_unary(UnaryOp op, const Value& v) {
    if (is_error(v)) return v;
    const Number* n = v.as<Number>();
    if (!n) return Value::error(ErrorCode::Value);
    return Value::number(op == UnaryOp::Minus ? -n->v : n->v);
}

static Value scalar_binary(BinaryOp op, const Value& a, const Value& b) {
    if (is_error(a)) return a;
    if (is_error(b)) return b;

    if (op == BinaryOp::Concat) {
        Value x = to_text(a);
        Value y = to_text(b);
        if (is_error(x) || is_error(y)) return Value::error(ErrorCode::Value);
        return Value::text(x.as<Text>()->v + y.as<Text>()->v);
    }
    if (is_comparison(op)) {
        auto r = compare(op, a, b);
        return r ? Value::boolean(*r) : Value::error(ErrorCode::Value);
    }

    Value x = numeric(a);
    if (is_error(x)) return x;
    Value y = numeric(b);
    if (is_error(y)) return y;
    double l = x.as<Number>()->v;
    double r = y.as<Number>()->v;
    switch (op) {
        case BinaryOp::Add: return checked(l + r);
        case BinaryOp::Sub: return checked(l - r);
        case BinaryOp::Mul: return checked(l * r);
        case BinaryOp::Div:
            if (r == 0.0) return Value::error(ErrorCode::Div0);
            return checked(l / r);
        case BinaryOp::Pow: return checked(std::pow(l, r));
        default:            return Value::error(ErrorCode::Value);
    }
}

static bool is_operand(const Value& v) {
    return is_scalar(v) || is_error(v) || v.is<Array>();
}

// Arrays combine cell by cell; everything else goes through scalar_binary.
static Value apply_binary(BinaryOp op, const Value& a, const Value& b) {
    if (!is_operand(a) || !is_operand(b)) return Value::error(ErrorCode::Value);

    auto fn = [op](const Value& x, const Value& y) { return scalar_binary(op, x, y); };
    const Array* la = a.as<Array>();
    const Array* ra = b.as<Array>();
    if (la && ra) return la->apply_with(*ra, fn);
    if (la) {
        Array out = *la;
        out.apply([&](const Value& x) { return fn(x, b); });
        return out;
    }
    if (ra) {
        Array out = *ra;
        out.apply([&](const Value& y) { return fn(a, y); });
        return out;
    }
    return fn(a, b);
}

static Value apply_unary(UnaryOp op, const Value& v) {
    if (const Array* arr = v.as<Array>()) {
        Array out = *arr;
        out.apply([op](const Value& x) { return scalar_unary(op, x); });
        return out;
    }
    if (!is_operand(v)) return Value::error(ErrorCode::Value);
    return scalar_unary(op, v);
}

// -----------------------------
// evaluate
// -----------------------------
static Value eval_call(const Call& n, Context& ctx) {
    const Identifier* id = n.callee->as<Identifier>();
    if (!id) return Value::error(ErrorCode::Name);

    Value fv;
    try {
        fv = ctx.resolve(id->name);
    } catch (const UndefinedError& e) {
        spdlog::debug("unknown function '{}': {}", id->name, e.what());
        return Value::error(ErrorCode::Name);
    } catch (const NotAvailableError& e) {
        spdlog::debug("unknown function '{}': {}", id->name, e.what());
        return Value::error(ErrorCode::Name);
    }

    const FunctionPtr* fn = fv.as<FunctionPtr>();
    if (!fn || !*fn) throw NotCallableError("'" + id->name + "' is not callable (" + type_name(fv) + ")");

    std::vector<Argument> args;
    args.reserve(n.args.size());
    for (const auto& a : n.args) args.emplace_back(*a);
    return (*fn)->call(args, ctx);
}

Value evaluate(const Expr& e, Context& ctx) {
    return std::visit([&](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Identifier>) {
            return ctx.resolve(n.name);
        } else if constexpr (std::is_same_v<T, NumberLit>) {
            return Value::number(n.value);
        } else if constexpr (std::is_same_v<T, TextLit>) {
            return Value::text(n.value);
        } else if constexpr (std::is_same_v<T, Unary>) {
            Value v = evaluate(*n.operand, ctx);
            if (is_error(v)) return v;
            return apply_unary(n.op, v);
        } else if constexpr (std::is_same_v<T, Binary>) {
            Value left = evaluate(*n.left, ctx);
            if (is_error(left)) return left;
            Value right = evaluate(*n.right, ctx);
            if (is_error(right)) return right;
            return apply_binary(n.op, left, right);
        } else if constexpr (std::is_same_v<T, Call>) {
            return eval_call(n, ctx);
        } else if constexpr (std::is_same_v<T, CellRef>) {
            return ctx.at(n.pos);
        } else {
            return ctx.range(n.start.pos, n.end.pos);
        }
    }, e.node);
}

// -----------------------------
// arguments
// -----------------------------
bool Predicate::test(const Value& v) const {
    if (!op) return true;
    auto r = compare(*op, v, operand);
    return r.value_or(false);
}

Value Argument::eval(Context& ctx) const {
    if (const Value* v = std::get_if<Value>(&arg_)) return *v;
    return evaluate(*std::get<const Expr*>(arg_), ctx);
}

std::optional<std::pair<Value, Predicate>> Argument::try_as_predicate(Context& ctx) const {
    const Expr* const* e = std::get_if<const Expr*>(&arg_);
    if (!e) return std::nullopt;
    const Binary* b = (*e)->as<Binary>();
    if (!b || !is_comparison(b->op)) return std::nullopt;

    Value source = evaluate(*b->left, ctx);
    Predicate pred{b->op, evaluate(*b->right, ctx)};
    return std::make_pair(std::move(source), std::move(pred));
}

// -----------------------------
// functions
// -----------------------------
namespace {

class DirectFunction : public FunctionValue {
public:
    DirectFunction(std::string name, DirectFn fn, std::size_t min_args, std::size_t max_args)
        : name_(std::move(name)), fn_(std::move(fn)), min_(min_args), max_(max_args) {}

    const std::string& name() const override { return name_; }

    Value call(const std::vector<Argument>& args, Context& ctx) const override {
        if (args.size() < min_ || args.size() > max_) {
            spdlog::debug("{}: unexpected argument count {}", name_, args.size());
            return Value::error(ErrorCode::Value);
        }
        std::vector<Value> values;
        values.reserve(args.size());
        for (const auto& a : args) values.push_back(a.eval(ctx));
        return fn_(values);
    }

private:
    std::string name_;
    DirectFn fn_;
    std::size_t min_;
    std::size_t max_;
};

class ReducerFunction : public FunctionValue {
public:
    ReducerFunction(std::string name, ReduceFn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    const std::string& name() const override { return name_; }

    Value call(const std::vector<Argument>& args, Context& ctx) const override {
        if (args.empty() || args.size() > 2) {
            spdlog::debug("{}: unexpected argument count {}", name_, args.size());
            return Value::error(ErrorCode::Value);
        }

        Value source;
        Predicate pred;
        if (args.size() == 2) {
            source = args[0].eval(ctx);
            pred = Predicate{BinaryOp::Eq, args[1].eval(ctx)};
        } else if (auto split = args[0].try_as_predicate(ctx)) {
            source = std::move(split->first);
            pred = std::move(split->second);
        } else {
            source = args[0].eval(ctx);
        }
        if (is_error(source)) return source;
        if (is_error(pred.operand)) return pred.operand;

        std::vector<Value> cells;
        if (const Array* arr = source.as<Array>()) {
            cells = arr->cells();
        } else if (is_scalar(source)) {
            cells.push_back(source);
        } else {
            return Value::error(ErrorCode::Value);
        }
        return fn_(cells, pred);
    }

private:
    std::string name_;
    ReduceFn fn_;
};

} // namespace

FunctionPtr make_function(std::string name, DirectFn fn, std::size_t min_args, std::size_t max_args) {
    return std::make_shared<DirectFunction>(std::move(name), std::move(fn), min_args, max_args);
}

FunctionPtr make_reducer(std::string name, ReduceFn fn) {
    return std::make_shared<ReducerFunction>(std::move(name), std::move(fn));
}

} // namespace cellexpr
