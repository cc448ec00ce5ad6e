#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <expected>
#include <format>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::driver {

auto ParseLogLevel(std::string_view text) -> Result<spdlog::level::level_enum> {
  std::string upper(text);
  std::ranges::transform(upper, upper.begin(), [](unsigned char ch) {
    return static_cast<char>(std::toupper(ch));
  });
  if (upper == "DEBUG") {
    return spdlog::level::debug;
  }
  if (upper == "INFO") {
    return spdlog::level::info;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return spdlog::level::warn;
  }
  if (upper == "ERROR") {
    return spdlog::level::err;
  }
  return std::unexpected(
      Diagnostic::Error(std::format("invalid log level '{}'", text))
          .WithNote("expected one of: DEBUG, INFO, WARNING, ERROR"));
}

void ConfigureLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::get("hwsuite");
  if (!logger) {
    logger = spdlog::stderr_color_mt("hwsuite");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%^%l%$ [%t] %v");
  spdlog::set_level(level);
}

}  // namespace hwsuite::driver
