#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::config {

inline constexpr std::string_view kConfigFileName = "hwsuite.toml";

struct BuildSettings {
  std::string dir = "cmake-build-debug";  // Relative to the project root
  std::string type = "Debug";
  int jobs = 2;
};

// External tools, looked up on PATH unless given as paths.
struct ToolPaths {
  std::filesystem::path cmake = "cmake";
  std::filesystem::path screen = "screen";
  std::filesystem::path valgrind = "valgrind";
};

// Defaults for `hwsuite check`; command-line flags override them.
struct CheckSettings {
  double pause = 0.5;
  double processing_timeout = 5.0;
  double suite_timeout = 300.0;
  int threads = 0;  // 0 = hardware concurrency
  std::string report = "diff";
  std::string stuff = "auto";
  std::string special_chars = "^#";
  bool eof = false;
  std::string require_screen = "auto";
  double await_interval = 0.0;  // 0 = no pre-feed polling
  int await_limit = 10;
  std::string memcheck = "applicability=never";
};

struct ProjectConfig {
  std::string name;
  BuildSettings build;
  ToolPaths executables;
  CheckSettings check;

  // Directory where hwsuite.toml was found
  std::filesystem::path root_dir;

  [[nodiscard]] auto BuildDir() const -> std::filesystem::path;
};

// Defaults for a project without hwsuite.toml.
auto DefaultConfig(const std::filesystem::path& root_dir) -> ProjectConfig;

// Search for hwsuite.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse hwsuite.toml. Every key is optional; a key of the wrong type is an
// error.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace hwsuite::config
