#include "cellexpr/grid.hpp"
#include "cellexpr/errors.hpp"

namespace cellexpr {

MutableView& View::writable() {
    throw ReadOnlyError("sheet '" + name() + "' is read only");
}

static std::int64_t extent(std::int64_t first, std::int64_t last) {
    return last == 0 ? 0 : last - first + 1;
}

std::optional<Value> SheetObject::find(std::string_view name) const {
    if (name == "name") return Value::text(view_.name());
    if (name == "readonly") return Value::boolean(view_.read_only());

    Range b = view_.bounds().normalize();
    if (name == "lines") return Value::number(static_cast<double>(extent(b.start.row, b.end.row)));
    if (name == "columns") return Value::number(static_cast<double>(extent(b.start.column, b.end.column)));
    if (name == "cells") {
        auto rows = view_.rows();
        Array out(rows.size(), rows.empty() ? 0 : rows.front().size());
        for (std::size_t r = 0; r < out.rows(); ++r) {
            for (std::size_t c = 0; c < out.columns() && c < rows[r].size(); ++c) {
                out.set(r, c, rows[r][c]);
            }
        }
        return Value(std::move(out));
    }
    return std::nullopt;
}

std::string WorkbookObject::display() const {
    View* active = workbook_.active_sheet();
    return active ? active->name() : std::string{};
}

std::optional<Value> WorkbookObject::find(std::string_view name) const {
    if (name == "sheets") {
        auto names = workbook_.sheet_names();
        Array out(names.size(), 1);
        for (std::size_t i = 0; i < names.size(); ++i) out.set(i, 0, Value::text(names[i]));
        return Value(std::move(out));
    }
    if (name == "active") {
        View* active = workbook_.active_sheet();
        if (!active) return Value::error(ErrorCode::Ref);
        return Value(ObjectPtr(std::make_shared<SheetObject>(*active)));
    }
    return std::nullopt;
}

} // namespace cellexpr
