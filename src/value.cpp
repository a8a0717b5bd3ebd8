#include "cellexpr/value.hpp"
#include "cellexpr/errors.hpp"
#include "cellexpr/eval.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace cellexpr {

const char* error_text(ErrorCode code) {
    switch (code) {
        case ErrorCode::Null:  return "#NULL!";
        case ErrorCode::Div0:  return "#DIV/0!";
        case ErrorCode::Value: return "#VALUE!";
        case ErrorCode::Ref:   return "#REF!";
        case ErrorCode::Name:  return "#NAME?";
        case ErrorCode::Num:   return "#NUM!";
        case ErrorCode::NA:    return "#N/A";
    }
    return "#N/A";
}

// -----------------------------
// Array
// -----------------------------
Array::Array() = default;
Array::Array(std::size_t rows, std::size_t columns) : rows_(rows), columns_(columns) {
    if (columns != 0 && rows > max_cells / columns) {
        throw EvalError("array too large: " + std::to_string(rows) + " x " + std::to_string(columns));
    }
    cells_.resize(rows * columns);
}
Array::Array(const Array&) = default;
Array::Array(Array&&) noexcept = default;
Array& Array::operator=(const Array&) = default;
Array& Array::operator=(Array&&) noexcept = default;
Array::~Array() = default;

const Value& Array::get(std::size_t row, std::size_t column) const {
    if (row >= rows_ || column >= columns_) {
        throw EvalError("array index out of range: (" + std::to_string(row) + ", " + std::to_string(column) + ")");
    }
    return cells_[row * columns_ + column];
}

void Array::set(std::size_t row, std::size_t column, Value v) {
    if (row >= rows_ || column >= columns_) {
        throw EvalError("array index out of range: (" + std::to_string(row) + ", " + std::to_string(column) + ")");
    }
    if (!is_scalar(v) && !is_error(v)) throw EvalError("array cells hold scalars only, got " + type_name(v));
    cells_[row * columns_ + column] = std::move(v);
}

void Array::apply(const std::function<Value(const Value&)>& fn) {
    for (auto& c : cells_) c = fn(c);
}

Array Array::apply_with(const Array& other, const std::function<Value(const Value&, const Value&)>& fn) const {
    if (empty() || other.empty()) return Array{};
    Array out(std::max(rows_, other.rows_), std::max(columns_, other.columns_));
    for (std::size_t r = 0; r < out.rows_; ++r) {
        for (std::size_t c = 0; c < out.columns_; ++c) {
            out.cells_[r * out.columns_ + c] =
                fn(get(r % rows_, c % columns_), other.get(r % other.rows_, c % other.columns_));
        }
    }
    return out;
}

// -----------------------------
// ObjectValue
// -----------------------------
Value ObjectValue::get(std::string_view name) const {
    if (auto v = find(name)) return *v;
    throw UndefinedError(type_name() + ": undefined property '" + std::string(name) + "'");
}

// -----------------------------
// inspection
// -----------------------------
ValueKind kind(const Value& v) {
    if (v.is<Error>()) return ValueKind::Error;
    if (v.is<Array>()) return ValueKind::Array;
    if (v.is<ObjectPtr>()) return ValueKind::Object;
    if (v.is<FunctionPtr>()) return ValueKind::Function;
    return ValueKind::Scalar;
}

bool is_error(const Value& v) { return v.is<Error>(); }
bool is_scalar(const Value& v) { return kind(v) == ValueKind::Scalar; }

std::string type_name(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Blank>) {
            return "blank";
        } else if constexpr (std::is_same_v<T, Number>) {
            return "number";
        } else if constexpr (std::is_same_v<T, Text>) {
            return "text";
        } else if constexpr (std::is_same_v<T, Boolean>) {
            return "boolean";
        } else if constexpr (std::is_same_v<T, Date>) {
            return "date";
        } else if constexpr (std::is_same_v<T, Error>) {
            return "error";
        } else if constexpr (std::is_same_v<T, Array>) {
            return "array(" + std::to_string(x.rows()) + ", " + std::to_string(x.columns()) + ")";
        } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            return x ? x->type_name() : "object";
        } else {
            return "function";
        }
    }, v.data);
}

static std::string number_text(double v) {
    std::ostringstream os;
    os << std::setprecision(15) << v;
    return os.str();
}

// Days since 1970-01-01 to a proleptic Gregorian date.
static void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

static std::string date_text(std::int64_t seconds) {
    std::int64_t days = seconds / 86400;
    if (seconds % 86400 < 0) --days;
    std::int64_t y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof buf, "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
    return buf;
}

std::string display(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Blank>) {
            return {};
        } else if constexpr (std::is_same_v<T, Number>) {
            return number_text(x.v);
        } else if constexpr (std::is_same_v<T, Text>) {
            return x.v;
        } else if constexpr (std::is_same_v<T, Boolean>) {
            return x.v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Date>) {
            return date_text(x.seconds);
        } else if constexpr (std::is_same_v<T, Error>) {
            return error_text(x.code);
        } else if constexpr (std::is_same_v<T, Array>) {
            return {};
        } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            return x ? x->display() : std::string{};
        } else {
            return x ? x->name() : std::string{};
        }
    }, v.data);
}

// -----------------------------
// coercions
// -----------------------------
static std::optional<double> parse_number(const std::string& s) {
    if (s.empty()) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(d)) return std::nullopt;
    return d;
}

Value to_number(const Value& v) {
    return std::visit([&](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Number>) {
            return x;
        } else if constexpr (std::is_same_v<T, Boolean>) {
            return Value::number(x.v ? 1.0 : 0.0);
        } else if constexpr (std::is_same_v<T, Text>) {
            auto d = parse_number(x.v);
            return d ? Value::number(*d) : Value::error(ErrorCode::NA);
        } else if constexpr (std::is_same_v<T, Date>) {
            return Value::number(static_cast<double>(x.seconds));
        } else if constexpr (std::is_same_v<T, Blank>) {
            return Value::number(0.0);
        } else if constexpr (std::is_same_v<T, Error>) {
            return x;
        } else {
            return Value::error(ErrorCode::Value);
        }
    }, v.data);
}

Value to_text(const Value& v) {
    if (is_error(v)) return v;
    if (!is_scalar(v)) return Value::error(ErrorCode::Value);
    return Value::text(display(v));
}

Value to_bool(const Value& v) {
    return std::visit([&](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Boolean>) {
            return x;
        } else if constexpr (std::is_same_v<T, Number>) {
            return Value::boolean(x.v != 0.0);
        } else if constexpr (std::is_same_v<T, Text>) {
            return Value::boolean(!x.v.empty());
        } else if constexpr (std::is_same_v<T, Date>) {
            return Value::boolean(x.seconds != 0);
        } else if constexpr (std::is_same_v<T, Blank>) {
            return Value::boolean(false);
        } else if constexpr (std::is_same_v<T, Error>) {
            return x;
        } else {
            return Value::error(ErrorCode::Value);
        }
    }, v.data);
}

std::optional<bool> equal(const Value& a, const Value& b) {
    if (a.data.index() != b.data.index()) return std::nullopt;
    if (auto x = a.as<Number>()) return x->v == b.as<Number>()->v;
    if (auto x = a.as<Text>()) return x->v == b.as<Text>()->v;
    if (auto x = a.as<Boolean>()) return x->v == b.as<Boolean>()->v;
    if (auto x = a.as<Date>()) return x->seconds == b.as<Date>()->seconds;
    if (a.is<Blank>()) return true;
    return std::nullopt;
}

std::optional<bool> less(const Value& a, const Value& b) {
    if (a.data.index() != b.data.index()) return std::nullopt;
    if (auto x = a.as<Number>()) return x->v < b.as<Number>()->v;
    if (auto x = a.as<Text>()) return x->v < b.as<Text>()->v;
    if (auto x = a.as<Boolean>()) return !x->v && b.as<Boolean>()->v;
    if (auto x = a.as<Date>()) return x->seconds < b.as<Date>()->seconds;
    if (a.is<Blank>()) return false;
    return std::nullopt;
}

} // namespace cellexpr
