#include "cellexpr/builtins.hpp"
#include "cellexpr/eval.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

namespace cellexpr {

namespace {

Value value_error() { return Value::error(ErrorCode::Value); }

// Numbers of the arguments, arrays flattened. Direct arguments are
// coerced; array cells that are not numbers are skipped. The first error
// met is returned instead.
std::optional<Value> collect_numbers(const std::vector<Value>& args, std::vector<double>& out) {
    for (const auto& a : args) {
        if (is_error(a)) return a;
        if (const Array* arr = a.as<Array>()) {
            for (const auto& c : arr->cells()) {
                if (is_error(c)) return c;
                if (const Number* n = c.as<Number>()) out.push_back(n->v);
            }
            continue;
        }
        Value n = to_number(a);
        if (is_error(n)) return value_error();
        out.push_back(n.as<Number>()->v);
    }
    return std::nullopt;
}

// All values of the arguments, arrays flattened.
std::vector<Value> flatten(const std::vector<Value>& args) {
    std::vector<Value> out;
    for (const auto& a : args) {
        if (const Array* arr = a.as<Array>()) {
            out.insert(out.end(), arr->cells().begin(), arr->cells().end());
        } else {
            out.push_back(a);
        }
    }
    return out;
}

std::optional<double> number_arg(const Value& v) {
    Value n = to_number(v);
    if (is_error(n)) return std::nullopt;
    return n.as<Number>()->v;
}

std::optional<std::string> text_arg(const Value& v) {
    Value t = to_text(v);
    if (is_error(t)) return std::nullopt;
    return t.as<Text>()->v;
}

// First error among the arguments, if any.
std::optional<Value> first_error(const std::vector<Value>& args) {
    for (const auto& a : args) {
        if (is_error(a)) return a;
    }
    return std::nullopt;
}

// -----------------------------
// math
// -----------------------------
Value fn_sum(const std::vector<Value>& args) {
    std::vector<double> xs;
    if (auto err = collect_numbers(args, xs)) return *err;
    double total = 0.0;
    for (double x : xs) total += x;
    return Value::number(total);
}

Value fn_avg(const std::vector<Value>& args) {
    std::vector<double> xs;
    if (auto err = collect_numbers(args, xs)) return *err;
    if (xs.empty()) return Value::number(0.0);
    double total = 0.0;
    for (double x : xs) total += x;
    return Value::number(total / static_cast<double>(xs.size()));
}

Value fn_min(const std::vector<Value>& args) {
    std::vector<double> xs;
    if (auto err = collect_numbers(args, xs)) return *err;
    if (xs.empty()) return Value::number(0.0);
    return Value::number(*std::min_element(xs.begin(), xs.end()));
}

Value fn_max(const std::vector<Value>& args) {
    std::vector<double> xs;
    if (auto err = collect_numbers(args, xs)) return *err;
    if (xs.empty()) return Value::number(0.0);
    return Value::number(*std::max_element(xs.begin(), xs.end()));
}

// Numbers and dates; direct arguments also count when they convert.
Value fn_count(const std::vector<Value>& args) {
    double n = 0;
    for (const auto& a : args) {
        if (const Array* arr = a.as<Array>()) {
            for (const auto& c : arr->cells()) {
                if (c.is<Number>() || c.is<Date>()) ++n;
            }
        } else if (is_scalar(a) && !a.is<Blank>() && !is_error(to_number(a))) {
            ++n;
        }
    }
    return Value::number(n);
}

enum class Rounding { Nearest, Down, Up };

Value round_with(const std::vector<Value>& args, Rounding mode) {
    if (auto err = first_error(args)) return *err;
    auto x = number_arg(args[0]);
    auto digits = args.size() > 1 ? number_arg(args[1]) : std::optional<double>(0.0);
    if (!x || !digits) return value_error();

    double scale = std::pow(10.0, std::trunc(*digits));
    double v = *x * scale;
    switch (mode) {
        case Rounding::Nearest: v = std::round(v); break;
        case Rounding::Down:    v = std::trunc(v); break;
        case Rounding::Up:      v = v < 0 ? std::floor(v) : std::ceil(v); break;
    }
    v /= scale;
    return std::isfinite(v) ? Value::number(v) : Value::error(ErrorCode::Num);
}

Value fn_sqrt(const std::vector<Value>& args) {
    if (is_error(args[0])) return args[0];
    auto x = number_arg(args[0]);
    if (!x) return value_error();
    if (*x < 0) return Value::error(ErrorCode::Num);
    return Value::number(std::sqrt(*x));
}

Value fn_now(const std::vector<Value>&) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return Date{static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count())};
}

Value fn_rand(const std::vector<Value>&) {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return Value::number(dist(gen));
}

// -----------------------------
// types
// -----------------------------
Value fn_typeof(const std::vector<Value>& args) { return Value::text(type_name(args[0])); }
Value fn_isnumber(const std::vector<Value>& args) { return Value::boolean(args[0].is<Number>()); }
Value fn_istext(const std::vector<Value>& args) { return Value::boolean(args[0].is<Text>()); }

// -----------------------------
// text
// -----------------------------
// Character counts as a non-negative size; nullopt when invalid.
std::optional<std::size_t> count_arg(const Value& v) {
    auto n = number_arg(v);
    if (!n || std::isnan(*n) || *n < 0) return std::nullopt;
    constexpr auto most = std::numeric_limits<std::size_t>::max();
    if (*n >= static_cast<double>(most)) return most;
    return static_cast<std::size_t>(std::trunc(*n));
}

Value fn_concat(const std::vector<Value>& args) {
    std::string out;
    for (const auto& v : flatten(args)) {
        if (is_error(v)) return v;
        auto t = text_arg(v);
        if (!t) return value_error();
        out += *t;
    }
    return Value::text(std::move(out));
}

Value fn_left(const std::vector<Value>& args) {
    if (auto err = first_error(args)) return *err;
    auto s = text_arg(args[0]);
    auto n = args.size() > 1 ? count_arg(args[1]) : std::optional<std::size_t>(1);
    if (!s || !n) return value_error();
    return Value::text(s->substr(0, *n));
}

Value fn_right(const std::vector<Value>& args) {
    if (auto err = first_error(args)) return *err;
    auto s = text_arg(args[0]);
    auto n = args.size() > 1 ? count_arg(args[1]) : std::optional<std::size_t>(1);
    if (!s || !n) return value_error();
    std::size_t k = std::min(*n, s->size());
    return Value::text(s->substr(s->size() - k));
}

// mid(text, start, count) with a 1-based start; substr makes count optional.
Value fn_mid(const std::vector<Value>& args) {
    if (auto err = first_error(args)) return *err;
    auto s = text_arg(args[0]);
    auto start = count_arg(args[1]);
    auto n = args.size() > 2 ? count_arg(args[2]) : std::optional<std::size_t>(std::string::npos);
    if (!s || !start || !n || *start < 1) return value_error();
    if (*start > s->size()) return Value::text("");
    return Value::text(s->substr(*start - 1, *n));
}

Value fn_len(const std::vector<Value>& args) {
    if (is_error(args[0])) return args[0];
    auto s = text_arg(args[0]);
    if (!s) return value_error();
    return Value::number(static_cast<double>(s->size()));
}

template <int (*Conv)(int)>
Value map_chars(const std::vector<Value>& args) {
    if (is_error(args[0])) return args[0];
    auto s = text_arg(args[0]);
    if (!s) return value_error();
    for (auto& c : *s) c = static_cast<char>(Conv(static_cast<unsigned char>(c)));
    return Value::text(std::move(*s));
}

int to_upper(int c) { return std::toupper(c); }
int to_lower(int c) { return std::tolower(c); }

// replace(text, start, count, new_text), 1-based start.
Value fn_replace(const std::vector<Value>& args) {
    if (auto err = first_error(args)) return *err;
    auto s = text_arg(args[0]);
    auto start = count_arg(args[1]);
    auto n = count_arg(args[2]);
    auto with = text_arg(args[3]);
    if (!s || !start || !n || !with || *start < 1) return value_error();
    std::size_t from = std::min(*start - 1, s->size());
    return Value::text(s->replace(from, *n, *with));
}

// -----------------------------
// logic
// -----------------------------
Value fn_if(const std::vector<Value>& args) {
    if (is_error(args[0])) return args[0];
    Value cond = to_bool(args[0]);
    if (is_error(cond)) return cond;
    if (cond.as<Boolean>()->v) return args[1];
    return args.size() > 2 ? args[2] : Value::boolean(false);
}

enum class Fold { And, Or, Xor };

Value fold_bools(const std::vector<Value>& args, Fold mode) {
    bool acc = mode == Fold::And;
    for (const auto& v : flatten(args)) {
        if (is_error(v)) return v;
        if (v.is<Blank>()) continue;
        Value b = to_bool(v);
        if (is_error(b)) return value_error();
        bool x = b.as<Boolean>()->v;
        switch (mode) {
            case Fold::And: acc = acc && x; break;
            case Fold::Or:  acc = acc || x; break;
            case Fold::Xor: acc = acc != x; break;
        }
    }
    return Value::boolean(acc);
}

Value fn_not(const std::vector<Value>& args) {
    Value b = to_bool(args[0]);
    if (is_error(b)) return is_error(args[0]) ? args[0] : value_error();
    return Value::boolean(!b.as<Boolean>()->v);
}

// -----------------------------
// reducers
// -----------------------------
Value rd_countif(const std::vector<Value>& cells, const Predicate& pred) {
    double n = 0;
    for (const auto& c : cells) {
        if (!c.is<Blank>() && pred.test(c)) ++n;
    }
    return Value::number(n);
}

Value rd_sumif(const std::vector<Value>& cells, const Predicate& pred) {
    double total = 0;
    for (const auto& c : cells) {
        const Number* n = c.as<Number>();
        if (n && pred.test(c)) total += n->v;
    }
    return Value::number(total);
}

Value rd_averageif(const std::vector<Value>& cells, const Predicate& pred) {
    double total = 0;
    double n = 0;
    for (const auto& c : cells) {
        const Number* x = c.as<Number>();
        if (x && pred.test(c)) {
            total += x->v;
            ++n;
        }
    }
    if (n == 0) return Value::error(ErrorCode::Div0);
    return Value::number(total / n);
}

Value rd_any(const std::vector<Value>& cells, const Predicate& pred) {
    for (const auto& c : cells) {
        if (!c.is<Blank>() && pred.test(c)) return Value::boolean(true);
    }
    return Value::boolean(false);
}

Value rd_all(const std::vector<Value>& cells, const Predicate& pred) {
    for (const auto& c : cells) {
        if (!c.is<Blank>() && !pred.test(c)) return Value::boolean(false);
    }
    return Value::boolean(true);
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

void define_both(Environment& env, const std::string& name, Value v) {
    std::string up = upper(name);
    if (up != name) env.define(up, v);
    env.define(name, std::move(v));
}

void def(Environment& env, const std::string& name, DirectFn fn, std::size_t min_args,
         std::size_t max_args = std::numeric_limits<std::size_t>::max()) {
    define_both(env, name, make_function(name, std::move(fn), min_args, max_args));
}

void def_reducer(Environment& env, const std::string& name, ReduceFn fn) {
    define_both(env, name, make_reducer(name, std::move(fn)));
}

} // namespace

void register_builtins(Environment& env) {
    env.define("TRUE", Value::boolean(true));
    env.define("FALSE", Value::boolean(false));
    env.define("true", Value::boolean(true));
    env.define("false", Value::boolean(false));

    def(env, "sum", fn_sum, 0);
    def(env, "avg", fn_avg, 0);
    def(env, "average", fn_avg, 0);
    def(env, "min", fn_min, 0);
    def(env, "max", fn_max, 0);
    def(env, "count", fn_count, 0);
    def(env, "round", [](const std::vector<Value>& a) { return round_with(a, Rounding::Nearest); }, 1, 2);
    def(env, "rounddown", [](const std::vector<Value>& a) { return round_with(a, Rounding::Down); }, 1, 2);
    def(env, "roundup", [](const std::vector<Value>& a) { return round_with(a, Rounding::Up); }, 1, 2);
    def(env, "sqrt", fn_sqrt, 1, 1);
    def(env, "now", fn_now, 0, 0);
    def(env, "rand", fn_rand, 0, 0);

    def(env, "typeof", fn_typeof, 1, 1);
    def(env, "isnumber", fn_isnumber, 1, 1);
    def(env, "istext", fn_istext, 1, 1);

    def(env, "concat", fn_concat, 1);
    def(env, "left", fn_left, 1, 2);
    def(env, "right", fn_right, 1, 2);
    def(env, "mid", fn_mid, 3, 3);
    def(env, "substr", fn_mid, 2, 3);
    def(env, "len", fn_len, 1, 1);
    def(env, "upper", map_chars<to_upper>, 1, 1);
    def(env, "lower", map_chars<to_lower>, 1, 1);
    def(env, "replace", fn_replace, 4, 4);

    def(env, "if", fn_if, 2, 3);
    def(env, "and", [](const std::vector<Value>& a) { return fold_bools(a, Fold::And); }, 1);
    def(env, "or", [](const std::vector<Value>& a) { return fold_bools(a, Fold::Or); }, 1);
    def(env, "xor", [](const std::vector<Value>& a) { return fold_bools(a, Fold::Xor); }, 1);
    def(env, "not", fn_not, 1, 1);

    def_reducer(env, "countif", rd_countif);
    def_reducer(env, "sumif", rd_sumif);
    def_reducer(env, "averageif", rd_averageif);
    def_reducer(env, "any", rd_any);
    def_reducer(env, "all", rd_all);
}

} // namespace cellexpr
