#pragma once
#include <spdlog/common.h>

#include "cellexpr/lexer.hpp"

namespace cellexpr {

struct Config {
    ScanMode mode{ScanMode::Formula};
    bool detect_cycles{true};
    spdlog::level::level_enum log_level{spdlog::level::warn};
};

/// Set the default logger's level from `cfg`, then let SPDLOG_LEVEL
/// override it. Sinks are left to the embedder.
void configure_logging(const Config& cfg);

} // namespace cellexpr
