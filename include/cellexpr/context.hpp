#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "cellexpr/address.hpp"
#include "cellexpr/grid.hpp"
#include "cellexpr/value.hpp"

namespace cellexpr {

/// Everything the evaluator needs from the outside world.
class Context {
public:
    virtual ~Context() = default;

    /// Named value (function, constant, property). Throws EvalError.
    virtual Value resolve(std::string_view name) = 0;
    /// Cell value. Throws EvalError when the context has no cells.
    virtual Value at(const Position& pos) = 0;
    /// Values of the area spanned by start and end, in any corner order.
    virtual Value range(const Position& start, const Position& end) = 0;
};

// -----------------------------
// Environment
// -----------------------------
/// Name table. Lookup goes: local names, then the default object's
/// properties, then the parent.
class Environment : public Context {
public:
    explicit Environment(Context* parent = nullptr) : parent_(parent) {}

    void define(std::string name, Value v);
    bool defines(std::string_view name) const;
    void set_default(ObjectPtr obj) { default_ = std::move(obj); }

    Value resolve(std::string_view name) override;
    Value at(const Position& pos) override;
    Value range(const Position& start, const Position& end) override;

private:
    Context* parent_;
    std::map<std::string, Value, std::less<>> values_{};
    ObjectPtr default_{};
};

// -----------------------------
// sheet and workbook scopes
// -----------------------------
/// Cells being read right now: (sheet, row, column).
using InFlight = std::set<std::tuple<std::string, std::int64_t, std::int64_t>>;

/// Cells of one view. References to other sheets go to the parent.
class SheetScope : public Context {
public:
    SheetScope(View& view, Context* parent = nullptr, bool detect_cycles = true,
               std::shared_ptr<InFlight> in_flight = nullptr);

    View& view() const { return view_; }

    Value resolve(std::string_view name) override;
    Value at(const Position& pos) override;
    Value range(const Position& start, const Position& end) override;

private:
    bool is_local(const Position& pos) const;
    Value read(std::int64_t row, std::int64_t column);

    View& view_;
    Context* parent_;
    bool detect_cycles_;
    std::shared_ptr<InFlight> in_flight_;
};

/// Cells of a workbook: the sheet named by the position, or the active one.
class WorkbookScope : public Context {
public:
    WorkbookScope(Workbook& workbook, Context* parent = nullptr, bool detect_cycles = true,
                  std::shared_ptr<InFlight> in_flight = nullptr);

    Value resolve(std::string_view name) override;
    Value at(const Position& pos) override;
    Value range(const Position& start, const Position& end) override;

private:
    View* select(const Position& pos) const;

    Workbook& workbook_;
    Context* parent_;
    bool detect_cycles_;
    std::shared_ptr<InFlight> in_flight_;
};

// -----------------------------
// ScopeStack
// -----------------------------
/// Stack of contexts searched top-down. Not thread safe: use one stack
/// per evaluating thread.
class ScopeStack : public Context {
public:
    /// Pops everything pushed after it was taken, once.
    class ScopeGuard {
    public:
        ScopeGuard(ScopeGuard&& o) noexcept : stack_(o.stack_), depth_(o.depth_) { o.stack_ = nullptr; }
        ScopeGuard& operator=(ScopeGuard&& o) noexcept;
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;
        ~ScopeGuard() { release(); }

        void release() noexcept;

    private:
        friend class ScopeStack;
        ScopeGuard(ScopeStack* stack, std::size_t depth) : stack_(stack), depth_(depth) {}

        ScopeStack* stack_;
        std::size_t depth_;
    };

    explicit ScopeStack(bool detect_cycles = true) : detect_cycles_(detect_cycles) {}
    ScopeStack(const ScopeStack&) = delete;
    ScopeStack& operator=(const ScopeStack&) = delete;

    [[nodiscard]] ScopeGuard push(Context& ctx);
    /// Push the cells of a named sheet. References to the workbook's
    /// other sheets still resolve. Throws UndefinedError.
    [[nodiscard]] ScopeGuard push_sheet(Workbook& workbook, std::string_view name);
    /// Same as push_sheet, for a sheet that must accept writes.
    /// Throws ReadOnlyError.
    [[nodiscard]] ScopeGuard push_mutable(Workbook& workbook, std::string_view name);

    std::size_t depth() const { return scopes_.size(); }

    Value resolve(std::string_view name) override;
    Value at(const Position& pos) override;
    Value range(const Position& start, const Position& end) override;

private:
    struct Entry {
        Context* ctx;
        std::unique_ptr<Context> owned; // set for scopes the stack built itself
    };

    ScopeGuard push_entry(Entry e);
    void truncate(std::size_t depth) noexcept;
    Value first_of(const std::function<Value(Context&)>& fn, const char* what);

    std::vector<Entry> scopes_{};
    bool detect_cycles_;
};

using ScopeGuard = ScopeStack::ScopeGuard;

} // namespace cellexpr
