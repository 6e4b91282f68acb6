#include "turnkit/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace turnkit::core {

void init_logging(const ObservabilityConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.log_level);
        level = spdlog::level::info;
    }

    spdlog::set_level(level);
    if (!config.log_pattern.empty()) {
        spdlog::set_pattern(config.log_pattern);
    }
    spdlog::debug("Logging initialized at level {}", config.log_level);
}

}  // namespace turnkit::core
