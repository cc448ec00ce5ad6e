#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace hwsuite::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the hwsuite binary with arguments
// - Managing temporary directories for test isolation
// - Creating project files (hwsuite.toml, question directories)
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     auto result = Run({"check", "--no-build"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run hwsuite with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run hwsuite from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a minimal hwsuite.toml
  void WriteProjectToml(const std::string& name);

  // Create a question directory with a main.cpp and a prebuilt bash
  // "executable" at <dir>/cmake-build/<name>.
  void WriteQuestion(
      const std::filesystem::path& relative_dir, const std::string& script);

  // Get path to test directory
  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path hwsuite_bin_;
};

}  // namespace hwsuite::test
