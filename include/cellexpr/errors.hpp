#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace cellexpr {

/// Malformed formula text. Carries the position of the offending token.
struct ParseError : std::runtime_error {
    ParseError(const std::string& msg, std::size_t line = 0, std::size_t column = 0)
        : std::runtime_error(line ? std::to_string(line) + ":" + std::to_string(column) + ": " + msg : msg),
          line_(line), column_(column) {}

    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

private:
    std::size_t line_;
    std::size_t column_;
};

struct AddressError : ParseError { using ParseError::ParseError; };

// Structural failures raised while evaluating. In-language errors
// (#DIV/0! and friends) are values, not exceptions.
struct EvalError : std::runtime_error { using std::runtime_error::runtime_error; };

struct UndefinedError    : EvalError { using EvalError::EvalError; };
struct NotAvailableError : EvalError { using EvalError::EvalError; };
struct NotCallableError  : EvalError { using EvalError::EvalError; };
struct ReadOnlyError     : EvalError { using EvalError::EvalError; };
struct CycleError        : EvalError { using EvalError::EvalError; };

} // namespace cellexpr
