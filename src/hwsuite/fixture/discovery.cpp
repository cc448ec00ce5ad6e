#include "hwsuite/fixture/discovery.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/file_io.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::fixture {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kBareExpected = "expected.txt";
constexpr std::string_view kExpectedSuffix = "-expected.txt";
constexpr std::string_view kExpectedOutputSuffix = "-expected-output.txt";
constexpr std::string_view kDeprecatedPrefix = "expected-output";

auto FromSuffixedId(std::string_view id) -> CounterpartNames {
  std::string base(id);
  return CounterpartNames{
      .input = base + "-input.txt",
      .env = base + "-env.txt",
      .args = base + "-args.txt",
  };
}

auto StripLineEnding(std::string_view line) -> std::string_view {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  while (!line.empty() && (line.front() == '\n' || line.front() == '\r')) {
    line.remove_prefix(1);
  }
  return line;
}

auto FixtureOrder(const Fixture& a, const Fixture& b) -> bool {
  auto id_a = a.Identifier();
  auto id_b = b.Identifier();
  if (id_a != id_b) {
    return id_a < id_b;
  }
  return a < b;
}

}  // namespace

auto IsExpectedFileName(std::string_view basename) -> bool {
  return basename == kBareExpected || basename.ends_with(kExpectedSuffix) ||
         basename.ends_with(kExpectedOutputSuffix) ||
         basename.starts_with(kDeprecatedPrefix);
}

auto DeriveCounterparts(std::string_view basename, bool suppress_deprecation)
    -> Result<CounterpartNames> {
  if (basename == kBareExpected) {
    return CounterpartNames{
        .input = "input.txt", .env = "env.txt", .args = "args.txt"};
  }
  if (basename.ends_with(kExpectedOutputSuffix)) {
    return FromSuffixedId(
        basename.substr(0, basename.size() - kExpectedOutputSuffix.size()));
  }
  if (basename.ends_with(kExpectedSuffix)) {
    return FromSuffixedId(
        basename.substr(0, basename.size() - kExpectedSuffix.size()));
  }
  if (basename.starts_with(kDeprecatedPrefix)) {
    if (!suppress_deprecation) {
      spdlog::warn(
          "use of prefix 'expected-output' is deprecated: {}; use suffix "
          "-expected.txt instead",
          basename);
    }
    std::string rest(basename.substr(kDeprecatedPrefix.size()));
    return CounterpartNames{
        .input = "input" + rest,
        .env = "env" + rest,
        .args = "args" + rest,
    };
  }
  return std::unexpected(
      Diagnostic::Error(
          std::format("expected-output name not recognized: {}", basename))
          .WithNote("use <id>-expected.txt or expected.txt"));
}

auto ParseEnvText(std::string_view text) -> EnvMap {
  EnvMap env;
  for (const auto& raw : common::SplitLines(std::string(text), false)) {
    std::string_view line = StripLineEnding(raw);
    if (line.empty()) {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string_view::npos) {
      env[std::string(line)] = "";
    } else {
      env[std::string(line.substr(0, eq))] = std::string(line.substr(eq + 1));
    }
  }
  return env;
}

auto ReadEnvFile(const fs::path& path) -> Result<EnvMap> {
  auto text = common::ReadFileText(path);
  if (!text) {
    return std::unexpected(text.error());
  }
  return ParseEnvText(*text);
}

auto ReadArgsFile(const fs::path& path) -> Result<std::vector<std::string>> {
  return common::ReadFileLines(path, true);
}

auto CreateFixture(const fs::path& expected_file) -> Result<Fixture> {
  auto names = DeriveCounterparts(expected_file.filename().string(), false);
  if (!names) {
    return std::unexpected(
        std::move(names.error())
            .WithNote(std::format("in {}", expected_file.string())));
  }
  fs::path parent = expected_file.parent_path();
  Fixture fixture{
      .input_file = std::nullopt,
      .expected_file = expected_file,
      .env = std::nullopt,
      .args = {},
      .expected_exit_code = 0,
  };
  if (fs::path input = parent / names->input; fs::exists(input)) {
    fixture.input_file = input;
  }
  if (fs::path env_file = parent / names->env; fs::exists(env_file)) {
    auto env = ReadEnvFile(env_file);
    if (!env) {
      return std::unexpected(env.error());
    }
    fixture.env = *std::move(env);
  }
  if (fs::path args_file = parent / names->args; fs::exists(args_file)) {
    auto args = ReadArgsFile(args_file);
    if (!args) {
      return std::unexpected(args.error());
    }
    fixture.args = *std::move(args);
  }
  return fixture;
}

auto DetectFixtures(const fs::path& dir) -> Result<std::vector<Fixture>> {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("not a directory: {}", dir.string())));
  }
  std::vector<fs::path> expected_files;
  for (auto it = fs::recursive_directory_iterator(dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file() &&
        IsExpectedFileName(it->path().filename().string())) {
      expected_files.push_back(it->path());
    }
  }
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("failed to scan {}: {}", dir.string(), ec.message())));
  }

  std::vector<Fixture> fixtures;
  fixtures.reserve(expected_files.size());
  for (const auto& path : expected_files) {
    auto fixture = CreateFixture(path);
    if (!fixture) {
      return std::unexpected(fixture.error());
    }
    fixtures.push_back(*std::move(fixture));
  }
  if (fixtures.empty()) {
    spdlog::debug("no expected-output files in {}", dir.string());
    fixtures.push_back(MakeExitCodeOnlyFixture());
    return fixtures;
  }
  std::ranges::sort(fixtures, FixtureOrder);
  return fixtures;
}

}  // namespace hwsuite::fixture
