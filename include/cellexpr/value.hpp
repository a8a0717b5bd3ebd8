#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cellexpr {

enum class ErrorCode { Null, Div0, Value, Ref, Name, Num, NA };

/// "#DIV/0!", "#N/A", ...
const char* error_text(ErrorCode code);

enum class ValueKind { Scalar, Error, Array, Object, Function };

struct Value;
class ObjectValue;
class FunctionValue;

using ObjectPtr   = std::shared_ptr<ObjectValue>;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct Blank   {};
struct Number  { double v{0.0}; };
struct Text    { std::string v; };
struct Boolean { bool v{false}; };
struct Date    { std::int64_t seconds{0}; }; // since 1970-01-01 UTC
struct Error   { ErrorCode code{ErrorCode::NA}; };

/// Row-major 2-D grid of scalar values.
class Array {
public:
    /// Largest number of cells one array may hold.
    static constexpr std::size_t max_cells = std::size_t{1} << 24;

    Array();
    /// Filled with blanks. Throws EvalError above max_cells.
    Array(std::size_t rows, std::size_t columns);
    Array(const Array&);
    Array(Array&&) noexcept;
    Array& operator=(const Array&);
    Array& operator=(Array&&) noexcept;
    ~Array();

    std::size_t rows() const { return rows_; }
    std::size_t columns() const { return columns_; }
    bool empty() const { return rows_ == 0 || columns_ == 0; }

    /// Bounds checked; throws EvalError.
    const Value& get(std::size_t row, std::size_t column) const;
    /// Bounds checked, scalars only; throws EvalError.
    void set(std::size_t row, std::size_t column, Value v);

    /// Replace every cell by fn(cell). An exception from fn stops the walk.
    void apply(const std::function<Value(const Value&)>& fn);

    /// Combine with `other` cell by cell. The result takes the larger
    /// dimensions; indices wrap modulo each operand's own dimensions.
    Array apply_with(const Array& other, const std::function<Value(const Value&, const Value&)>& fn) const;

    /// Cells in row-major order.
    const std::vector<Value>& cells() const { return cells_; }

private:
    std::size_t rows_{0};
    std::size_t columns_{0};
    std::vector<Value> cells_;
};

using ValueData = std::variant<Blank, Number, Text, Boolean, Date, Error, Array, ObjectPtr, FunctionPtr>;

struct Value {
    ValueData data{};

    Value() = default;
    Value(Blank b) : data(b) {}
    Value(Number n) : data(n) {}
    Value(Text t) : data(std::move(t)) {}
    Value(Boolean b) : data(b) {}
    Value(Date d) : data(d) {}
    Value(Error e) : data(e) {}
    Value(Array a) : data(std::move(a)) {}
    Value(ObjectPtr o) : data(std::move(o)) {}
    Value(FunctionPtr f) : data(std::move(f)) {}

    static Value number(double v) { return Number{v}; }
    static Value text(std::string v) { return Text{std::move(v)}; }
    static Value boolean(bool v) { return Boolean{v}; }
    static Value error(ErrorCode c) { return Error{c}; }

    template <class T>
    bool is() const { return std::holds_alternative<T>(data); }

    template <class T>
    const T* as() const { return std::get_if<T>(&data); }
};

/// Named properties, such as a sheet or workbook exposed to formulas.
class ObjectValue {
public:
    virtual ~ObjectValue() = default;

    virtual std::string type_name() const = 0;
    virtual std::string display() const = 0;
    virtual std::optional<Value> find(std::string_view name) const = 0;

    /// Throws UndefinedError for unknown properties.
    Value get(std::string_view name) const;
};

ValueKind kind(const Value& v);
bool is_error(const Value& v);
bool is_scalar(const Value& v);

/// "number", "text", "array(2, 3)", ...
std::string type_name(const Value& v);
/// Canonical display string.
std::string display(const Value& v);

// -----------------------------
// coercions
// -----------------------------
// Each returns a Number / Text / Boolean on success and an Error value
// otherwise. Errors propagate unchanged.
Value to_number(const Value& v);
Value to_text(const Value& v);
Value to_bool(const Value& v);

/// nullopt when the two values are not comparable.
std::optional<bool> equal(const Value& a, const Value& b);
std::optional<bool> less(const Value& a, const Value& b);

} // namespace cellexpr
