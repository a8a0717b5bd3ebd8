#include "cellexpr/parser.hpp"
#include "cellexpr/errors.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

namespace cellexpr {

static std::optional<BinaryOp> binary_op(TokKind k) {
    switch (k) {
        case TokKind::Plus:  return BinaryOp::Add;
        case TokKind::Minus: return BinaryOp::Sub;
        case TokKind::Star:  return BinaryOp::Mul;
        case TokKind::Slash: return BinaryOp::Div;
        case TokKind::Caret: return BinaryOp::Pow;
        case TokKind::Amp:   return BinaryOp::Concat;
        case TokKind::Eq:    return BinaryOp::Eq;
        case TokKind::Ne:    return BinaryOp::Ne;
        case TokKind::Lt:    return BinaryOp::Lt;
        case TokKind::Le:    return BinaryOp::Le;
        case TokKind::Gt:    return BinaryOp::Gt;
        case TokKind::Ge:    return BinaryOp::Ge;
        default:             return std::nullopt;
    }
}

static bool is_right_assoc(BinaryOp op) { return op == BinaryOp::Pow; }

Parser::Grammar Parser::formula_grammar() {
    Grammar g;
    g.prefix[TokKind::Ident]   = &Parser::parse_ident;
    g.prefix[TokKind::Number]  = &Parser::parse_number;
    g.prefix[TokKind::Literal] = &Parser::parse_literal;
    g.prefix[TokKind::Plus]    = &Parser::parse_unary;
    g.prefix[TokKind::Minus]   = &Parser::parse_unary;
    g.prefix[TokKind::LParen]  = &Parser::parse_group;

    g.infix[TokKind::LParen] = &Parser::parse_call;
    g.bindings[TokKind::LParen] = PowCall;

    for (TokKind k : {TokKind::Plus, TokKind::Minus, TokKind::Star, TokKind::Slash, TokKind::Caret,
                      TokKind::Amp, TokKind::Eq, TokKind::Ne, TokKind::Lt, TokKind::Le,
                      TokKind::Gt, TokKind::Ge}) {
        g.infix[k] = &Parser::parse_binary;
        g.bindings[k] = binding_power(*binary_op(k));
    }
    return g;
}

Parser::Parser(ScanMode mode) : grammar_(formula_grammar()), mode_(mode) {}

void Parser::init(std::string_view text, ScanMode mode) {
    lex_.emplace(text, mode);
    curr_ = Token{};
    peek_ = lex_->scan();
    next();
}

void Parser::next() {
    curr_ = std::move(peek_);
    peek_ = lex_->scan();
}

int Parser::power(TokKind k) const {
    auto it = grammar_.bindings.find(k);
    return it == grammar_.bindings.end() ? PowLowest : it->second;
}

void Parser::fail(const std::string& msg) const {
    spdlog::debug("parse error at {}:{}: {} (token {})", curr_.line, curr_.column, msg, describe(curr_));
    throw ParseError(msg, curr_.line, curr_.column);
}

void Parser::skip_lines() {
    while (is(TokKind::Eol) || is(TokKind::Comment)) next();
}

ExprPtr Parser::parse(std::string_view text) {
    init(text, mode_);
    skip_lines();
    if (done()) fail("empty formula");
    ExprPtr e = parse_expr(PowLowest);
    skip_lines();
    if (!done()) fail("unexpected " + describe(curr_) + " after formula");
    return e;
}

std::vector<ExprPtr> Parser::parse_script(std::string_view text) {
    init(text, ScanMode::Script);
    std::vector<ExprPtr> out;
    for (skip_lines(); !done(); skip_lines()) {
        out.push_back(parse_expr(PowLowest));
        if (is(TokKind::Eol)) {
            next();
        } else if (!done()) {
            fail("expected end of line, got " + describe(curr_));
        }
    }
    return out;
}

// Precedence climbing: a prefix rule, then infix rules for as long as the
// next operator binds tighter than `pow`.
ExprPtr Parser::parse_expr(int pow) {
    auto pit = grammar_.prefix.find(curr_.kind);
    if (pit == grammar_.prefix.end()) {
        if (is(TokKind::Invalid)) fail("invalid token '" + curr_.text + "'");
        if (is(TokKind::Keyword)) fail("unsupported keyword '" + curr_.text + "'");
        fail("unexpected " + describe(curr_));
    }
    ExprPtr left = (this->*(pit->second))();

    while (!done() && pow < power(curr_.kind)) {
        auto iit = grammar_.infix.find(curr_.kind);
        if (iit == grammar_.infix.end()) fail("unsupported infix operator " + describe(curr_));
        left = (this->*(iit->second))(std::move(left));
    }
    return left;
}

ExprPtr Parser::parse_ident() {
    if (peek_.kind == TokKind::LParen) {
        ExprPtr id = make_identifier(curr_.text);
        next();
        return id;
    }
    if (peek_.kind == TokKind::Bang) {
        std::string sheet = curr_.text;
        next();
        next();
        return parse_address(sheet);
    }
    return parse_address({});
}

// Address, range, or plain identifier when the token does not decode.
ExprPtr Parser::parse_address(const std::string& sheet) {
    if (!is(TokKind::Ident)) fail("cell address expected, got " + describe(curr_));

    std::string text = curr_.text;
    auto start = try_decode(text);
    if (!start) {
        if (!sheet.empty() || text.find('$') != std::string::npos) fail("invalid cell address '" + text + "'");
        next();
        return make_identifier(std::move(text));
    }
    start->sheet = sheet;
    next();

    if (!is(TokKind::Colon)) return make_cell(std::move(*start));

    next();
    // The end corner may repeat a sheet prefix: Sheet1!A1:Sheet1!B2.
    std::string end_sheet = sheet;
    if ((is(TokKind::Ident) || is(TokKind::Literal)) && peek_.kind == TokKind::Bang) {
        end_sheet = curr_.text;
        next();
        next();
    }
    if (!is(TokKind::Ident)) fail("cell address expected after ':', got " + describe(curr_));
    auto end = try_decode(curr_.text);
    if (!end) fail("invalid cell address '" + curr_.text + "'");
    end->sheet = std::move(end_sheet);
    next();
    return make_range(std::move(*start), std::move(*end));
}

ExprPtr Parser::parse_number() {
    const char* begin = curr_.text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0') fail("invalid number '" + curr_.text + "'");
    next();
    return make_number(v);
}

ExprPtr Parser::parse_literal() {
    if (peek_.kind == TokKind::Bang) {
        // 'My Sheet'!A1
        std::string sheet = curr_.text;
        next();
        next();
        return parse_address(sheet);
    }
    ExprPtr e = make_text(curr_.text);
    next();
    return e;
}

ExprPtr Parser::parse_unary() {
    UnaryOp op = is(TokKind::Minus) ? UnaryOp::Minus : UnaryOp::Plus;
    next();
    return make_unary(op, parse_expr(PowUnary));
}

ExprPtr Parser::parse_group() {
    next();
    ExprPtr e = parse_expr(PowLowest);
    if (!is(TokKind::RParen)) fail("missing ')' at end of expression");
    next();
    return e;
}

ExprPtr Parser::parse_call(ExprPtr callee) {
    if (!callee->as<Identifier>()) fail("only named functions can be called");
    next(); // '('
    std::vector<ExprPtr> args;
    while (!done() && !is(TokKind::RParen)) {
        args.push_back(parse_expr(PowLowest));
        if (is(TokKind::Comma)) {
            next();
            if (done() || is(TokKind::RParen)) fail("argument expected after ','");
        } else if (!is(TokKind::RParen)) {
            fail("unexpected " + describe(curr_) + " in function call");
        }
    }
    if (!is(TokKind::RParen)) fail("missing ')' at end of function call");
    next();
    return make_call(std::move(callee), std::move(args));
}

ExprPtr Parser::parse_binary(ExprPtr left) {
    BinaryOp op = *binary_op(curr_.kind);
    int pow = binding_power(op);
    next();
    ExprPtr right = parse_expr(is_right_assoc(op) ? pow - 1 : pow);
    return make_binary(op, std::move(left), std::move(right));
}

ExprPtr parse(std::string_view text) {
    Parser p;
    return p.parse(text);
}

std::vector<ExprPtr> parse_script(std::string_view text) {
    Parser p(ScanMode::Script);
    return p.parse_script(text);
}

} // namespace cellexpr
