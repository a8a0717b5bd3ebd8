#include "cellexpr/lexer.hpp"
#include <array>
#include <cctype>

namespace cellexpr {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_blank(char c) { return c == ' ' || c == '\t'; }
static bool is_nl(char c) { return c == '\n' || c == '\r'; }
static bool is_quote(char c) { return c == '\'' || c == '"'; }

bool is_keyword(std::string_view word) {
    static constexpr std::array<std::string_view, 20> keywords{
        "import", "use", "using", "with", "print", "save", "export",
        "default", "from", "in", "as", "to", "end", "ro", "rw",
        "lock", "unlock", "push", "pop", "clear",
    };
    for (auto kw : keywords) {
        if (kw == word) return true;
    }
    return false;
}

std::string describe(const Token& tok) {
    switch (tok.kind) {
        case TokKind::End:     return "<eof>";
        case TokKind::Eol:     return "<eol>";
        case TokKind::Invalid: return "<invalid>";
        case TokKind::Keyword: return "keyword(" + tok.text + ")";
        case TokKind::Ident:   return "identifier(" + tok.text + ")";
        case TokKind::Number:  return "number(" + tok.text + ")";
        case TokKind::Literal: return "literal(" + tok.text + ")";
        case TokKind::Comment: return "comment(" + tok.text + ")";
        case TokKind::Assign:  return "':='";
        case TokKind::Plus:    return "'+'";
        case TokKind::Minus:   return "'-'";
        case TokKind::Star:    return "'*'";
        case TokKind::Slash:   return "'/'";
        case TokKind::Caret:   return "'^'";
        case TokKind::Amp:     return "'&'";
        case TokKind::Eq:      return "'='";
        case TokKind::Ne:      return "'<>'";
        case TokKind::Lt:      return "'<'";
        case TokKind::Le:      return "'<='";
        case TokKind::Gt:      return "'>'";
        case TokKind::Ge:      return "'>='";
        case TokKind::Comma:   return "','";
        case TokKind::Dot:     return "'.'";
        case TokKind::LParen:  return "'('";
        case TokKind::RParen:  return "')'";
        case TokKind::LSquare: return "'['";
        case TokKind::RSquare: return "']'";
        case TokKind::LCurly:  return "'{'";
        case TokKind::RCurly:  return "'}'";
        case TokKind::Colon:   return "':'";
        case TokKind::Bang:    return "'!'";
    }
    return "<unknown>";
}

Lexer::Lexer(std::string_view s, ScanMode mode) : s_(s), mode_(mode) {
    // "=A1+1" and "A1+1" are the same formula.
    skip_blanks();
    if (!is_end() && s_[i_] == '=') advance();
}

char Lexer::peek(std::size_t ahead) const {
    return i_ + ahead < s_.size() ? s_[i_ + ahead] : '\0';
}

void Lexer::advance() {
    if (is_end()) return;
    if (s_[i_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++i_;
}

void Lexer::skip_blanks() {
    while (!is_end()) {
        char c = s_[i_];
        if (is_blank(c) || (mode_ == ScanMode::Formula && is_nl(c))) {
            advance();
            continue;
        }
        break;
    }
}

Token Lexer::scan() {
    skip_blanks();

    Token t;
    t.line = line_;
    t.column = column_;
    if (is_end()) return t;

    char c = s_[i_];
    if (mode_ == ScanMode::Script && is_nl(c)) {
        while (!is_end() && (is_nl(s_[i_]) || is_blank(s_[i_]))) advance();
        t.kind = TokKind::Eol;
        return t;
    }
    if (mode_ == ScanMode::Script && c == '#') {
        scan_comment(t);
        return t;
    }
    if (is_digit(c)) {
        scan_number(t);
        return t;
    }
    if (is_quote(c)) {
        scan_literal(t);
        return t;
    }
    if (is_ident_start(c)) {
        scan_ident(t);
        return t;
    }
    scan_operator(t);
    return t;
}

void Lexer::scan_number(Token& t) {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) advance();
    if (!is_end() && s_[i_] == '.') {
        advance();
        while (!is_end() && is_digit(s_[i_])) advance();
    }
    t.kind = TokKind::Number;
    t.text = std::string(s_.substr(start, i_ - start));
}

void Lexer::scan_literal(Token& t) {
    char quote = s_[i_];
    advance();
    std::size_t start = i_;
    while (!is_end() && s_[i_] != quote) advance();
    t.text = std::string(s_.substr(start, i_ - start));
    if (is_end()) {
        t.kind = TokKind::Invalid; // unterminated
        return;
    }
    advance(); // closing quote
    t.kind = TokKind::Literal;
}

void Lexer::scan_ident(Token& t) {
    std::size_t start = i_;
    while (!is_end() && is_ident_char(s_[i_])) advance();
    t.kind = TokKind::Ident;
    t.text = std::string(s_.substr(start, i_ - start));
    if (mode_ == ScanMode::Script && is_keyword(t.text)) t.kind = TokKind::Keyword;
}

void Lexer::scan_comment(Token& t) {
    advance(); // '#'
    while (!is_end() && is_blank(s_[i_])) advance();
    std::size_t start = i_;
    while (!is_end() && !is_nl(s_[i_])) advance();
    std::size_t end = i_;
    while (end > start && is_blank(s_[end - 1])) --end;
    t.kind = TokKind::Comment;
    t.text = std::string(s_.substr(start, end - start));
    while (!is_end() && is_nl(s_[i_])) advance();
}

void Lexer::scan_operator(Token& t) {
    char c = s_[i_];
    advance();
    switch (c) {
        case '+': t.kind = TokKind::Plus; return;
        case '-': t.kind = TokKind::Minus; return;
        case '*': t.kind = TokKind::Star; return;
        case '/': t.kind = TokKind::Slash; return;
        case '^': t.kind = TokKind::Caret; return;
        case '&': t.kind = TokKind::Amp; return;
        case '=': t.kind = TokKind::Eq; return;
        case ',': t.kind = TokKind::Comma; return;
        case '.': t.kind = TokKind::Dot; return;
        case '(': t.kind = TokKind::LParen; return;
        case ')': t.kind = TokKind::RParen; return;
        case '[': t.kind = TokKind::LSquare; return;
        case ']': t.kind = TokKind::RSquare; return;
        case '{': t.kind = TokKind::LCurly; return;
        case '}': t.kind = TokKind::RCurly; return;
        case '!': t.kind = TokKind::Bang; return;
        case ':':
            t.kind = TokKind::Colon;
            if (mode_ == ScanMode::Script && peek() == '=') {
                advance();
                t.kind = TokKind::Assign;
            }
            return;
        case '<':
            t.kind = TokKind::Lt;
            if (peek() == '=') {
                advance();
                t.kind = TokKind::Le;
            } else if (peek() == '>') {
                advance();
                t.kind = TokKind::Ne;
            }
            return;
        case '>':
            t.kind = TokKind::Gt;
            if (peek() == '=') {
                advance();
                t.kind = TokKind::Ge;
            }
            return;
        default:
            t.kind = TokKind::Invalid;
            t.text = std::string(1, c);
            return;
    }
}

} // namespace cellexpr
