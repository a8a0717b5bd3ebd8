#include "cellexpr/grid_stub.hpp"
#include "cellexpr/errors.hpp"

#include <algorithm>

namespace cellexpr {

std::optional<Cell> MemorySheet::cell(const Position& pos) const {
    auto it = cells_.find({pos.row, pos.column});
    if (it == cells_.end()) return std::nullopt;
    return Cell{display(it->second), it->second};
}

Range MemorySheet::bounds() const {
    Range r;
    if (cells_.empty()) return r;
    r.start.row = cells_.begin()->first.first;
    r.end.row = cells_.rbegin()->first.first;
    r.start.column = cells_.begin()->first.second;
    r.end.column = r.start.column;
    for (const auto& [key, v] : cells_) {
        r.start.column = std::min(r.start.column, key.second);
        r.end.column = std::max(r.end.column, key.second);
    }
    r.start.sheet = name_;
    r.end.sheet = name_;
    return r;
}

std::vector<std::vector<Value>> MemorySheet::rows() const {
    std::vector<std::vector<Value>> out;
    if (cells_.empty()) return out;
    Range b = bounds();
    out.assign(static_cast<std::size_t>(b.height() + 1),
               std::vector<Value>(static_cast<std::size_t>(b.width() + 1)));
    for (const auto& [key, v] : cells_) {
        out[static_cast<std::size_t>(key.first - b.start.row)]
           [static_cast<std::size_t>(key.second - b.start.column)] = v;
    }
    return out;
}

void MemorySheet::set(const Position& pos, Value v) {
    if (locked_) throw ReadOnlyError("sheet '" + name_ + "' is read only");
    if (pos.row < 1 || pos.column < 1) throw AddressError("invalid cell address: " + encode(pos));
    if (!is_scalar(v) && !is_error(v)) throw EvalError("cells hold scalars only, got " + type_name(v));
    if (v.is<Blank>()) {
        cells_.erase({pos.row, pos.column});
        return;
    }
    cells_[{pos.row, pos.column}] = std::move(v);
}

MutableView& MemorySheet::writable() {
    if (locked_) throw ReadOnlyError("sheet '" + name_ + "' is read only");
    return *this;
}

MemorySheet& MemoryWorkbook::add_sheet(std::string name) {
    sheets_.push_back(std::make_unique<MemorySheet>(std::move(name)));
    return *sheets_.back();
}

void MemoryWorkbook::set_active(std::string_view name) {
    for (std::size_t i = 0; i < sheets_.size(); ++i) {
        if (sheets_[i]->name() == name) {
            active_ = i;
            return;
        }
    }
    throw UndefinedError("unknown sheet: " + std::string(name));
}

View* MemoryWorkbook::sheet(std::string_view name) {
    for (auto& s : sheets_) {
        if (s->name() == name) return s.get();
    }
    return nullptr;
}

View* MemoryWorkbook::active_sheet() {
    return active_ < sheets_.size() ? sheets_[active_].get() : nullptr;
}

std::vector<std::string> MemoryWorkbook::sheet_names() const {
    std::vector<std::string> out;
    out.reserve(sheets_.size());
    for (const auto& s : sheets_) out.push_back(s->name());
    return out;
}

} // namespace cellexpr
