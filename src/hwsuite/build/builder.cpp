#include "hwsuite/build/builder.hpp"

#include <expected>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/subprocess.hpp"

namespace hwsuite::build {

auto Builder::ConfigureCommand() const -> std::vector<std::string> {
  return {
      config_.executables.cmake.string(),
      std::format("-DCMAKE_BUILD_TYPE={}", config_.build.type),
      "-S",
      config_.root_dir.string(),
      "-B",
      config_.BuildDir().string(),
  };
}

auto Builder::BuildCommand() const -> std::vector<std::string> {
  return {
      config_.executables.cmake.string(),
      "--build",
      config_.BuildDir().string(),
      "--parallel",
      std::to_string(config_.build.jobs),
  };
}

auto Builder::RunStep(const std::vector<std::string>& argv) const
    -> Result<void> {
  spdlog::debug("running {}", argv.front());
  auto completed = common::RunCommand(argv);
  if (!completed) {
    return std::unexpected(completed.error());
  }
  spdlog::debug("{}", completed->stdout_text);
  if (completed->exit_code != 0) {
    std::string excerpt = completed->stderr_text.substr(0, kMaxErrorExcerpt);
    auto diag = Diagnostic::HostError(
        std::format(
            "{} exited with code {}", argv.front(), completed->exit_code));
    if (!excerpt.empty()) {
      diag = std::move(diag).WithNote(excerpt);
    }
    return std::unexpected(std::move(diag));
  }
  return {};
}

auto Builder::Build() const -> Result<void> {
  spdlog::info("building {} in {}", config_.name, config_.BuildDir().string());
  auto configured = RunStep(ConfigureCommand());
  if (!configured) {
    return configured;
  }
  return RunStep(BuildCommand());
}

}  // namespace hwsuite::build
