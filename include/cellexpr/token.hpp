#pragma once
#include <cstddef>
#include <string>

namespace cellexpr {

enum class TokKind {
    End,
    Eol,
    Invalid,
    Keyword,
    Ident,
    Number,
    Literal,
    Comment,
    Assign,

    Plus, Minus, Star, Slash, Caret, Amp,
    Eq, Ne, Lt, Le, Gt, Ge,

    Comma,
    Dot,
    LParen, RParen,   // grouping
    LSquare, RSquare, // property
    LCurly, RCurly,   // block
    Colon,            // range marker
    Bang,             // sheet marker
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{}; // Ident / Number / Literal / Keyword / Comment
    std::size_t line{1};
    std::size_t column{1};
};

/// Short human readable name, used in parse error messages.
std::string describe(const Token& tok);

} // namespace cellexpr
