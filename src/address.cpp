#include "cellexpr/address.hpp"
#include "cellexpr/errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace cellexpr {

// Beyond this the column number no longer fits comfortably in int64.
static constexpr std::size_t max_column_letters = 10;

static bool is_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::int64_t column_index(std::string_view letters) {
    if (letters.empty() || letters.size() > max_column_letters) return 0;
    std::int64_t index = 0;
    for (char c : letters) {
        if (!is_letter(c)) return 0;
        char up = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        index = index * 26 + (up - 'A' + 1);
    }
    return index;
}

std::string column_name(std::int64_t column) {
    std::string out;
    while (column > 0) {
        --column;
        out.insert(out.begin(), static_cast<char>('A' + column % 26));
        column /= 26;
    }
    return out;
}

Position decode(std::string_view text) {
    if (text.empty()) throw AddressError("empty cell address");

    Position pos;
    std::size_t i = 0;
    if (text[i] == '$') {
        pos.absolute_column = true;
        ++i;
    }
    std::size_t start = i;
    while (i < text.size() && is_letter(text[i])) ++i;
    if (i == start) throw AddressError("invalid cell address - missing column: " + std::string(text));
    pos.column = column_index(text.substr(start, i - start));
    if (pos.column == 0) throw AddressError("invalid cell address - column too large: " + std::string(text));

    if (i < text.size() && text[i] == '$') {
        pos.absolute_row = true;
        ++i;
    }
    if (i >= text.size()) throw AddressError("invalid cell address - missing row: " + std::string(text));

    std::int64_t row = 0;
    for (; i < text.size(); ++i) {
        if (!is_digit(text[i])) {
            throw AddressError("invalid cell address - invalid row number: " + std::string(text));
        }
        int d = text[i] - '0';
        if (row > (std::numeric_limits<std::int64_t>::max() - d) / 10) {
            throw AddressError("invalid cell address - row out of range: " + std::string(text));
        }
        row = row * 10 + d;
    }
    pos.row = row;
    return pos;
}

Position decode_qualified(std::string_view text) {
    auto bang = text.rfind('!');
    if (bang == std::string_view::npos) return decode(text);
    if (bang == 0) throw AddressError("invalid cell address - empty sheet name: " + std::string(text));

    std::string_view sheet = text.substr(0, bang);
    if (sheet.size() >= 2 && (sheet.front() == '\'' || sheet.front() == '"') && sheet.back() == sheet.front()) {
        sheet = sheet.substr(1, sheet.size() - 2);
    }
    Position pos = decode(text.substr(bang + 1));
    pos.sheet = std::string(sheet);
    return pos;
}

std::optional<Position> try_decode(std::string_view text) {
    try {
        return decode(text);
    } catch (const AddressError&) {
        return std::nullopt;
    }
}

std::string encode(const Position& p) {
    if (p.column <= 0) return {};
    std::string out;
    if (!p.sheet.empty()) {
        out += p.sheet;
        out += '!';
    }
    if (p.absolute_column) out += '$';
    out += column_name(p.column);
    if (p.absolute_row) out += '$';
    out += std::to_string(p.row);
    return out;
}

std::string encode(const Range& r) {
    if (r.start.same_cell(r.end) && r.start.absolute_column == r.end.absolute_column &&
        r.start.absolute_row == r.end.absolute_row) {
        return encode(r.start);
    }
    Position end = r.end;
    if (end.sheet == r.start.sheet) end.sheet.clear(); // the sheet prefix is written once
    return encode(r.start) + ":" + encode(end);
}

Position offset(const Position& p, std::int64_t delta_row, std::int64_t delta_column) {
    Position out = p;
    if (!out.absolute_row) out.row += delta_row;
    if (!out.absolute_column) out.column += delta_column;
    return out;
}

Range Range::normalize() const {
    Range r{start, end};
    r.start.row = std::min(start.row, end.row);
    r.start.column = std::min(start.column, end.column);
    r.end.row = std::max(start.row, end.row);
    r.end.column = std::max(start.column, end.column);
    return r;
}

bool Range::contains(const Position& p) const {
    Range r = normalize();
    return p.row >= r.start.row && p.row <= r.end.row &&
           p.column >= r.start.column && p.column <= r.end.column;
}

} // namespace cellexpr
