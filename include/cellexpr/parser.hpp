#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cellexpr/ast.hpp"
#include "cellexpr/lexer.hpp"

namespace cellexpr {

/// Pratt parser. Cheap to construct; one instance may parse many formulas
/// but only one at a time.
class Parser {
public:
    explicit Parser(ScanMode mode = ScanMode::Formula);

    /// Parse one complete formula. In script mode blank lines and comments
    /// around it are allowed. Throws ParseError.
    ExprPtr parse(std::string_view text);

    /// Parse newline separated expressions (script mode), skipping blank
    /// lines and comments. Throws ParseError.
    std::vector<ExprPtr> parse_script(std::string_view text);

private:
    using PrefixFn = ExprPtr (Parser::*)();
    using InfixFn  = ExprPtr (Parser::*)(ExprPtr);

    struct Grammar {
        std::unordered_map<TokKind, PrefixFn> prefix;
        std::unordered_map<TokKind, InfixFn> infix;
        std::unordered_map<TokKind, int> bindings;
    };
    static Grammar formula_grammar();

    void init(std::string_view text, ScanMode mode);
    ExprPtr parse_expr(int pow);
    void next();
    void skip_lines();
    bool done() const { return curr_.kind == TokKind::End; }
    bool is(TokKind k) const { return curr_.kind == k; }
    int power(TokKind k) const;
    [[noreturn]] void fail(const std::string& msg) const;

    // prefix rules
    ExprPtr parse_ident();
    ExprPtr parse_number();
    ExprPtr parse_literal();
    ExprPtr parse_unary();
    ExprPtr parse_group();
    // infix rules
    ExprPtr parse_call(ExprPtr callee);
    ExprPtr parse_binary(ExprPtr left);

    ExprPtr parse_address(const std::string& sheet);

    Grammar grammar_;
    ScanMode mode_;
    std::optional<Lexer> lex_{};
    Token curr_{};
    Token peek_{};
};

/// One-shot helpers over a fresh Parser.
ExprPtr parse(std::string_view text);
std::vector<ExprPtr> parse_script(std::string_view text);

} // namespace cellexpr
