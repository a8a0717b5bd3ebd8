#include "cellexpr/config.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

namespace cellexpr {

void configure_logging(const Config& cfg) {
    spdlog::set_level(cfg.log_level);
    spdlog::cfg::load_env_levels();
}

} // namespace cellexpr
