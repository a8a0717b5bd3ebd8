#pragma once
#include <cstddef>
#include <string_view>
#include "cellexpr/token.hpp"

namespace cellexpr {

enum class ScanMode {
    Formula, // line breaks are blanks, no keywords
    Script,  // line breaks and '#' comments are tokens, keywords recognized
};

bool is_keyword(std::string_view word);

class Lexer {
public:
    explicit Lexer(std::string_view s, ScanMode mode = ScanMode::Formula);

    // Never throws: bad input comes back as TokKind::Invalid.
    Token scan();

    ScanMode mode() const { return mode_; }

private:
    void skip_blanks();
    void advance();
    char peek(std::size_t ahead = 0) const;
    bool is_end() const { return i_ >= s_.size(); }

    void scan_number(Token& t);
    void scan_literal(Token& t);
    void scan_ident(Token& t);
    void scan_comment(Token& t);
    void scan_operator(Token& t);

    std::string_view s_;
    std::size_t i_{0};
    std::size_t line_{1};
    std::size_t column_{1};
    ScanMode mode_;
};

} // namespace cellexpr
