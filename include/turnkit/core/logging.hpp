#pragma once

#include "config.hpp"

namespace turnkit::core {

// Apply level and pattern to the global spdlog logger
void init_logging(const ObservabilityConfig& config);

}  // namespace turnkit::core
