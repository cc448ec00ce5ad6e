#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"

namespace hwsuite::driver {

inline constexpr std::string_view kMainSource = "main.cpp";
inline constexpr std::string_view kNoCheckMarker = ".nocheck";
inline constexpr std::string_view kFallbackBuildDir = "cmake-build";

// A directory with a main.cpp; its name is the executable's name.
struct Question {
  std::string name;
  std::filesystem::path dir;
  std::filesystem::path relative_dir;  // From the project root

  auto operator==(const Question&) const -> bool = default;
};

// Every question under the project root, sorted by relative path, skipping
// the build directory and directories holding a .nocheck file. Explicit
// subdirs restrict the set and must each hold a main.cpp.
auto FindQuestions(
    const config::ProjectConfig& config,
    const std::vector<std::string>& subdirs) -> Result<std::vector<Question>>;

// <build dir>/<relative dir>/<name>, else <dir>/cmake-build/<name>. Returns
// the first form when neither exists.
auto ResolveExecutable(
    const config::ProjectConfig& config, const Question& question)
    -> std::filesystem::path;

}  // namespace hwsuite::driver
