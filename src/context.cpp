#include "cellexpr/context.hpp"
#include "cellexpr/errors.hpp"

#include <exception>
#include <optional>
#include <spdlog/spdlog.h>

namespace cellexpr {

// -----------------------------
// Environment
// -----------------------------
void Environment::define(std::string name, Value v) {
    values_[std::move(name)] = std::move(v);
}

bool Environment::defines(std::string_view name) const {
    return values_.find(name) != values_.end();
}

Value Environment::resolve(std::string_view name) {
    if (auto it = values_.find(name); it != values_.end()) return it->second;
    if (default_) {
        if (auto v = default_->find(name)) return *v;
    }
    if (parent_) return parent_->resolve(name);
    throw UndefinedError("undefined identifier: " + std::string(name));
}

Value Environment::at(const Position& pos) {
    throw NotAvailableError("cell " + encode(pos) + " is not available in this context");
}

Value Environment::range(const Position& start, const Position& end) {
    throw NotAvailableError("range " + encode(Range{start, end}) + " is not available in this context");
}

// -----------------------------
// SheetScope
// -----------------------------
SheetScope::SheetScope(View& view, Context* parent, bool detect_cycles, std::shared_ptr<InFlight> in_flight)
    : view_(view), parent_(parent), detect_cycles_(detect_cycles), in_flight_(std::move(in_flight)) {
    if (detect_cycles_ && !in_flight_) in_flight_ = std::make_shared<InFlight>();
}

Value SheetScope::resolve(std::string_view name) {
    if (!parent_) throw NotAvailableError("sheet '" + view_.name() + "' cannot resolve '" + std::string(name) + "'");
    return parent_->resolve(name);
}

bool SheetScope::is_local(const Position& pos) const {
    return pos.sheet.empty() || pos.sheet == view_.name();
}

// Removes the cell from the in-flight set on every exit path.
namespace {
class InFlightMark {
public:
    InFlightMark(InFlight& set, InFlight::iterator it) : set_(set), it_(it) {}
    InFlightMark(const InFlightMark&) = delete;
    InFlightMark& operator=(const InFlightMark&) = delete;
    ~InFlightMark() { set_.erase(it_); }

private:
    InFlight& set_;
    InFlight::iterator it_;
};
} // namespace

Value SheetScope::read(std::int64_t row, std::int64_t column) {
    Position pos;
    pos.row = row;
    pos.column = column;

    std::optional<InFlightMark> mark;
    if (detect_cycles_) {
        auto [it, inserted] = in_flight_->emplace(view_.name(), row, column);
        if (!inserted) {
            spdlog::warn("circular reference at {}!{}", view_.name(), encode(pos));
            throw CycleError("circular reference at " + view_.name() + "!" + encode(pos));
        }
        mark.emplace(*in_flight_, it);
    }

    auto c = view_.cell(pos);
    return c ? c->value : Value{};
}

Value SheetScope::at(const Position& pos) {
    if (!is_local(pos)) {
        if (!parent_) return Value::error(ErrorCode::Ref);
        return parent_->at(pos);
    }
    if (pos.row < 1 || pos.column < 1) return Value::error(ErrorCode::Ref);
    return read(pos.row, pos.column);
}

Value SheetScope::range(const Position& start, const Position& end) {
    if (start.sheet != end.sheet) return Value::error(ErrorCode::Ref);
    if (!is_local(start)) {
        if (!parent_) return Value::error(ErrorCode::Ref);
        return parent_->range(start, end);
    }
    Range r = Range{start, end}.normalize();
    if (r.start.row < 1 || r.start.column < 1) return Value::error(ErrorCode::Ref);

    std::int64_t rows = r.height() + 1;
    std::int64_t columns = r.width() + 1;
    if (rows > static_cast<std::int64_t>(Array::max_cells) / columns) {
        spdlog::debug("range {} exceeds {} cells", encode(r), Array::max_cells);
        return Value::error(ErrorCode::Ref);
    }

    Array out(static_cast<std::size_t>(rows), static_cast<std::size_t>(columns));
    for (std::size_t i = 0; i < out.rows(); ++i) {
        for (std::size_t j = 0; j < out.columns(); ++j) {
            Value v = read(r.start.row + static_cast<std::int64_t>(i), r.start.column + static_cast<std::int64_t>(j));
            if (!is_scalar(v) && !is_error(v)) v = Value::error(ErrorCode::Value);
            out.set(i, j, std::move(v));
        }
    }
    return out;
}

// -----------------------------
// WorkbookScope
// -----------------------------
WorkbookScope::WorkbookScope(Workbook& workbook, Context* parent, bool detect_cycles,
                             std::shared_ptr<InFlight> in_flight)
    : workbook_(workbook), parent_(parent), detect_cycles_(detect_cycles), in_flight_(std::move(in_flight)) {
    if (detect_cycles_ && !in_flight_) in_flight_ = std::make_shared<InFlight>();
}

Value WorkbookScope::resolve(std::string_view name) {
    if (!parent_) throw NotAvailableError("workbook cannot resolve '" + std::string(name) + "'");
    return parent_->resolve(name);
}

View* WorkbookScope::select(const Position& pos) const {
    return pos.sheet.empty() ? workbook_.active_sheet() : workbook_.sheet(pos.sheet);
}

Value WorkbookScope::at(const Position& pos) {
    View* view = select(pos);
    if (!view) return Value::error(ErrorCode::Ref);
    SheetScope scope(*view, parent_, detect_cycles_, in_flight_);
    return scope.at(pos);
}

Value WorkbookScope::range(const Position& start, const Position& end) {
    if (start.sheet != end.sheet) return Value::error(ErrorCode::Ref);
    View* view = select(start);
    if (!view) return Value::error(ErrorCode::Ref);
    SheetScope scope(*view, parent_, detect_cycles_, in_flight_);
    return scope.range(start, end);
}

// -----------------------------
// ScopeStack
// -----------------------------
ScopeStack::ScopeGuard& ScopeStack::ScopeGuard::operator=(ScopeGuard&& o) noexcept {
    if (this != &o) {
        release();
        stack_ = o.stack_;
        depth_ = o.depth_;
        o.stack_ = nullptr;
    }
    return *this;
}

void ScopeStack::ScopeGuard::release() noexcept {
    if (!stack_) return;
    stack_->truncate(depth_);
    stack_ = nullptr;
}

ScopeStack::ScopeGuard ScopeStack::push_entry(Entry e) {
    std::size_t depth = scopes_.size();
    scopes_.push_back(std::move(e));
    spdlog::trace("scope push: depth {} -> {}", depth, scopes_.size());
    return ScopeGuard(this, depth);
}

ScopeStack::ScopeGuard ScopeStack::push(Context& ctx) {
    return push_entry(Entry{&ctx, nullptr});
}

namespace {
// One sheet backed by its workbook, sharing a single in-flight set.
class BoundSheet : public Context {
public:
    BoundSheet(Workbook& workbook, View& view, bool detect_cycles)
        : in_flight_(detect_cycles ? std::make_shared<InFlight>() : nullptr),
          book_(workbook, nullptr, detect_cycles, in_flight_),
          sheet_(view, &book_, detect_cycles, in_flight_) {}

    Value resolve(std::string_view name) override { return sheet_.resolve(name); }
    Value at(const Position& pos) override { return sheet_.at(pos); }
    Value range(const Position& start, const Position& end) override { return sheet_.range(start, end); }

private:
    std::shared_ptr<InFlight> in_flight_;
    WorkbookScope book_;
    SheetScope sheet_;
};
} // namespace

ScopeStack::ScopeGuard ScopeStack::push_sheet(Workbook& workbook, std::string_view name) {
    View* view = workbook.sheet(name);
    if (!view) throw UndefinedError("unknown sheet: " + std::string(name));
    auto scope = std::make_unique<BoundSheet>(workbook, *view, detect_cycles_);
    Context* ctx = scope.get();
    return push_entry(Entry{ctx, std::move(scope)});
}

ScopeStack::ScopeGuard ScopeStack::push_mutable(Workbook& workbook, std::string_view name) {
    View* view = workbook.sheet(name);
    if (!view) throw UndefinedError("unknown sheet: " + std::string(name));
    MutableView& target = view->writable();
    auto scope = std::make_unique<BoundSheet>(workbook, target, detect_cycles_);
    Context* ctx = scope.get();
    return push_entry(Entry{ctx, std::move(scope)});
}

void ScopeStack::truncate(std::size_t depth) noexcept {
    if (depth >= scopes_.size()) return;
    spdlog::trace("scope restore: depth {} -> {}", scopes_.size(), depth);
    scopes_.erase(scopes_.begin() + static_cast<std::ptrdiff_t>(depth), scopes_.end());
}

// Top-down search. A scope that fails structurally is skipped; when all
// fail, the last failure is rethrown. Cycles abort the search.
Value ScopeStack::first_of(const std::function<Value(Context&)>& fn, const char* what) {
    std::exception_ptr last;
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        try {
            return fn(*it->ctx);
        } catch (const CycleError&) {
            throw;
        } catch (const EvalError&) {
            last = std::current_exception();
        }
    }
    if (last) std::rethrow_exception(last);
    throw NotAvailableError(std::string(what) + ": no scope available");
}

Value ScopeStack::resolve(std::string_view name) {
    if (scopes_.empty()) throw UndefinedError("undefined identifier: " + std::string(name));
    return first_of([&](Context& c) { return c.resolve(name); }, "resolve");
}

Value ScopeStack::at(const Position& pos) {
    return first_of([&](Context& c) { return c.at(pos); }, "cell");
}

Value ScopeStack::range(const Position& start, const Position& end) {
    return first_of([&](Context& c) { return c.range(start, end); }, "range");
}

} // namespace cellexpr
