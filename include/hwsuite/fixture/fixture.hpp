#pragma once

#include <compare>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hwsuite::fixture {

using EnvMap = std::map<std::string, std::string>;

// One test case for a subject executable. A fixture without an expected file
// only checks the exit code.
struct Fixture {
  std::optional<std::filesystem::path> input_file;
  std::optional<std::filesystem::path> expected_file;
  std::optional<EnvMap> env;
  std::vector<std::string> args;
  int expected_exit_code = 0;

  auto operator==(const Fixture&) const -> bool = default;
  auto operator<=>(const Fixture&) const = default;

  [[nodiscard]] auto IsExitCodeOnly() const -> bool {
    return !expected_file.has_value();
  }

  [[nodiscard]] auto CheckExitCode(int exit_code) const -> bool {
    return exit_code == expected_exit_code;
  }

  // The <id> token of the expected filename; empty for bare expected.txt and
  // exit-code-only fixtures.
  [[nodiscard]] auto Identifier() const -> std::string;

  // Short label for logs and reports.
  [[nodiscard]] auto DisplayName() const -> std::string;

  template <typename H>
  friend auto AbslHashValue(H h, const Fixture& f) -> H {
    auto path_string = [](const std::optional<std::filesystem::path>& p) {
      return p ? std::optional<std::string>(p->string()) : std::nullopt;
    };
    h = H::combine(
        std::move(h), path_string(f.input_file), path_string(f.expected_file),
        f.args, f.expected_exit_code, f.env.has_value());
    if (f.env) {
      for (const auto& entry : *f.env) {
        h = H::combine(std::move(h), entry);
      }
      h = H::combine(std::move(h), f.env->size());
    }
    return h;
  }
};

// Fixture that requires only a zero exit code.
auto MakeExitCodeOnlyFixture() -> Fixture;

}  // namespace hwsuite::fixture
