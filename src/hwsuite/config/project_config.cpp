#include "hwsuite/config/project_config.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::config {

namespace fs = std::filesystem;

namespace {

// Copy section.key into target if present; wrong types are errors.
template <typename T>
auto ReadKey(
    toml::node_view<toml::node> section, std::string_view key,
    const fs::path& config_path, T& target) -> Result<void> {
  auto node = section[key];
  if (!node) {
    return {};
  }
  auto value = node.template value<T>();
  if (!value) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: field '{}' has the wrong type", config_path.string(),
                key)));
  }
  target = *value;
  return {};
}

auto ReadPath(
    toml::node_view<toml::node> section, std::string_view key,
    const fs::path& config_path, fs::path& target) -> Result<void> {
  std::string text = target.string();
  auto read = ReadKey(section, key, config_path, text);
  if (!read) {
    return read;
  }
  target = text;
  return {};
}

auto RequirePositive(
    double value, std::string_view key, const fs::path& config_path)
    -> Result<void> {
  if (value < 0.0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: field '{}' must not be negative", config_path.string(),
                key)));
  }
  return {};
}

}  // namespace

auto ProjectConfig::BuildDir() const -> fs::path {
  fs::path dir = build.dir;
  return dir.is_absolute() ? dir : root_dir / dir;
}

auto DefaultConfig(const fs::path& root_dir) -> ProjectConfig {
  ProjectConfig config;
  config.root_dir = fs::absolute(root_dir);
  config.name = config.root_dir.filename().string();
  return config;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config = DefaultConfig(config_path.parent_path());

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(), e.what())));
  }

  // Collects the first failure from a run of ReadKey calls.
  Result<void> status;
  auto read = [&](Result<void> result) {
    if (status && !result) {
      status = std::move(result);
    }
  };

  auto project = tbl["project"];
  read(ReadKey(project, "name", config_path, config.name));

  auto build = tbl["build"];
  read(ReadKey(build, "dir", config_path, config.build.dir));
  read(ReadKey(build, "type", config_path, config.build.type));
  read(ReadKey(build, "jobs", config_path, config.build.jobs));

  auto tools = tbl["executables"];
  read(ReadPath(tools, "cmake", config_path, config.executables.cmake));
  read(ReadPath(tools, "screen", config_path, config.executables.screen));
  read(ReadPath(tools, "valgrind", config_path, config.executables.valgrind));

  auto check = tbl["check"];
  CheckSettings& cs = config.check;
  read(ReadKey(check, "pause", config_path, cs.pause));
  read(ReadKey(
      check, "processing_timeout", config_path, cs.processing_timeout));
  read(ReadKey(check, "suite_timeout", config_path, cs.suite_timeout));
  read(ReadKey(check, "threads", config_path, cs.threads));
  read(ReadKey(check, "report", config_path, cs.report));
  read(ReadKey(check, "stuff", config_path, cs.stuff));
  read(ReadKey(check, "special_chars", config_path, cs.special_chars));
  read(ReadKey(check, "eof", config_path, cs.eof));
  read(ReadKey(check, "require_screen", config_path, cs.require_screen));
  read(ReadKey(check, "await_interval", config_path, cs.await_interval));
  read(ReadKey(check, "await_limit", config_path, cs.await_limit));
  read(ReadKey(check, "memcheck", config_path, cs.memcheck));
  if (!status) {
    return std::unexpected(status.error());
  }

  read(RequirePositive(cs.pause, "check.pause", config_path));
  read(RequirePositive(
      cs.processing_timeout, "check.processing_timeout", config_path));
  read(RequirePositive(cs.suite_timeout, "check.suite_timeout", config_path));
  read(RequirePositive(cs.await_interval, "check.await_interval", config_path));
  if (config.build.jobs < 1) {
    read(std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: field 'build.jobs' must be at least 1",
                config_path.string()))));
  }
  if (!status) {
    return std::unexpected(status.error());
  }
  return config;
}

}  // namespace hwsuite::config
