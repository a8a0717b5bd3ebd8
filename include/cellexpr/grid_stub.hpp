#pragma once
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cellexpr/grid.hpp"

namespace cellexpr {

/// A tiny in-memory sheet used for tests and examples.
/// Replace with your real storage engine.
class MemorySheet : public MutableView {
public:
    explicit MemorySheet(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }
    std::optional<Cell> cell(const Position& pos) const override;
    Range bounds() const override;
    std::vector<std::vector<Value>> rows() const override;

    void set(const Position& pos, Value v) override;
    /// Convenience for tests: set("B2", 42).
    void set(std::string_view address, Value v) { set(decode(address), std::move(v)); }

    void lock(bool locked) { locked_ = locked; }
    bool read_only() const override { return locked_; }
    MutableView& writable() override;

private:
    std::string name_;
    std::map<std::pair<std::int64_t, std::int64_t>, Value> cells_; // (row, column)
    bool locked_{false};
};

/// Ordered collection of MemorySheets; the first sheet added is active.
class MemoryWorkbook : public Workbook {
public:
    MemorySheet& add_sheet(std::string name);
    /// Throws UndefinedError for an unknown sheet.
    void set_active(std::string_view name);

    View* sheet(std::string_view name) override;
    View* active_sheet() override;
    std::vector<std::string> sheet_names() const override;

private:
    std::vector<std::unique_ptr<MemorySheet>> sheets_;
    std::size_t active_{0};
};

} // namespace cellexpr
