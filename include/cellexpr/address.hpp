#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cellexpr {

/// A cell address. Column and row are 1-based; 0 means "unset".
struct Position {
    std::string sheet{}; // empty: unqualified
    std::int64_t column{0};
    std::int64_t row{0};
    bool absolute_column{false};
    bool absolute_row{false};

    bool operator==(const Position& o) const {
        return sheet == o.sheet && column == o.column && row == o.row &&
               absolute_column == o.absolute_column && absolute_row == o.absolute_row;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }

    bool same_cell(const Position& o) const { return column == o.column && row == o.row; }
};

struct Range {
    Position start{};
    Position end{};

    /// Copy with start <= end on both axes. Flags and sheet follow start.
    Range normalize() const;
    bool contains(const Position& p) const;

    std::int64_t width() const { return end.column - start.column; }
    std::int64_t height() const { return end.row - start.row; }
};

/// "A" -> 1, "Z" -> 26, "AA" -> 27. Case insensitive. Returns 0 when
/// `letters` holds anything but letters.
std::int64_t column_index(std::string_view letters);
/// Inverse of column_index; 0 renders as an empty string.
std::string column_name(std::int64_t column);

/// Parse "$A$1" style text (no sheet prefix). Throws AddressError.
Position decode(std::string_view text);
/// Same as decode, with an optional "Sheet!" prefix.
Position decode_qualified(std::string_view text);
std::optional<Position> try_decode(std::string_view text);

std::string encode(const Position& p);
std::string encode(const Range& r);

/// Shift the non-absolute components of `p`.
Position offset(const Position& p, std::int64_t delta_row, std::int64_t delta_column);

} // namespace cellexpr
