#pragma once

#include <string_view>

#include <spdlog/common.h>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::driver {

// DEBUG, INFO, WARNING or ERROR, case-insensitive.
auto ParseLogLevel(std::string_view text) -> Result<spdlog::level::level_enum>;

// Route the default logger to stderr with thread ids in each line.
void ConfigureLogging(spdlog::level::level_enum level);

}  // namespace hwsuite::driver
