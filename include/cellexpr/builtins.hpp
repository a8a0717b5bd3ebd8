#pragma once
#include "cellexpr/context.hpp"

namespace cellexpr {

/// Define the standard functions and the TRUE / FALSE constants in `env`.
/// Every function is reachable under its lower and upper case name
/// ("sum", "SUM").
void register_builtins(Environment& env);

} // namespace cellexpr
