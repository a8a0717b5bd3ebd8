#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cellexpr/address.hpp"
#include "cellexpr/value.hpp"

namespace cellexpr {

struct Cell {
    std::string display{};
    Value value{};
};

class MutableView;

/// Read access to one sheet. Implemented by the storage engine.
class View {
public:
    virtual ~View() = default;

    virtual std::string name() const = 0;
    /// nullopt for a cell that holds nothing.
    virtual std::optional<Cell> cell(const Position& pos) const = 0;
    /// Occupied area; (0,0)-(0,0) when the sheet is empty.
    virtual Range bounds() const = 0;
    /// Values of bounds(), row by row, blanks for holes.
    virtual std::vector<std::vector<Value>> rows() const = 0;

    virtual bool read_only() const { return true; }
    /// Throws ReadOnlyError unless the view accepts writes.
    virtual MutableView& writable();
};

class MutableView : public View {
public:
    virtual void set(const Position& pos, Value v) = 0;

    bool read_only() const override { return false; }
    MutableView& writable() override { return *this; }
};

class Workbook {
public:
    virtual ~Workbook() = default;

    /// nullptr for an unknown sheet.
    virtual View* sheet(std::string_view name) = 0;
    /// nullptr for a workbook without sheets.
    virtual View* active_sheet() = 0;
    virtual std::vector<std::string> sheet_names() const = 0;
};

// -----------------------------
// introspection
// -----------------------------
// Both hold non-owning references; the view or workbook must outlive them.

/// Properties: name, lines, columns, cells, readonly.
class SheetObject : public ObjectValue {
public:
    explicit SheetObject(View& view) : view_(view) {}

    std::string type_name() const override { return "sheet"; }
    std::string display() const override { return view_.name(); }
    std::optional<Value> find(std::string_view name) const override;

private:
    View& view_;
};

/// Properties: sheets, active.
class WorkbookObject : public ObjectValue {
public:
    explicit WorkbookObject(Workbook& workbook) : workbook_(workbook) {}

    std::string type_name() const override { return "workbook"; }
    std::string display() const override;
    std::optional<Value> find(std::string_view name) const override;

private:
    Workbook& workbook_;
};

} // namespace cellexpr
