#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::fixture {

// Sibling basenames derived from an expected-output basename.
struct CounterpartNames {
  std::string input;
  std::string env;
  std::string args;

  auto operator==(const CounterpartNames&) const -> bool = default;
};

// True if the basename looks like an expected-output file.
auto IsExpectedFileName(std::string_view basename) -> bool;

// Map an expected-output basename to its input/env/args counterparts.
// The deprecated expected-output<id>.txt form logs a warning unless
// suppress_deprecation is set.
auto DeriveCounterparts(std::string_view basename, bool suppress_deprecation)
    -> Result<CounterpartNames>;

// KEY=VALUE per line, split on the first '='. A line without '=' is a key
// with an empty value; blank lines are skipped.
auto ParseEnvText(std::string_view text) -> EnvMap;
auto ReadEnvFile(const std::filesystem::path& path) -> Result<EnvMap>;

// One argument per line.
auto ReadArgsFile(const std::filesystem::path& path)
    -> Result<std::vector<std::string>>;

// Build a fixture from an expected-output file, attaching the input, env and
// args siblings that exist.
auto CreateFixture(const std::filesystem::path& expected_file)
    -> Result<Fixture>;

// Recursively find fixtures under dir, sorted by identifier. A directory
// without expected-output files yields one exit-code-only fixture.
auto DetectFixtures(const std::filesystem::path& dir)
    -> Result<std::vector<Fixture>>;

}  // namespace hwsuite::fixture
