#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include "hwsuite/build/builder.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/file_io.hpp"
#include "hwsuite/common/scoped_temp_directory.hpp"
#include "hwsuite/config/project_config.hpp"
#include "tests/common/test_files.hpp"

namespace hwsuite::build {
namespace {

namespace fs = std::filesystem;

class BuilderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.emplace(common::CreateScopedTempDirectory("builder_test"));
    config_ = config::DefaultConfig(Dir());
    config_.name = "hw";
  }

  [[nodiscard]] auto Dir() const -> const fs::path& {
    return dir_->Path();
  }

  // Stand-in for cmake that records its arguments.
  void UseFakeCmake(const std::string& body) {
    fs::path fake = Dir() / "fake-cmake";
    test::WriteScript(fake, body);
    config_.executables.cmake = fake;
  }

  config::ProjectConfig config_;

 private:
  std::optional<common::ScopedTempDirectory> dir_;
};

TEST_F(BuilderTest, CommandsFollowConfig) {
  config_.build.type = "Release";
  config_.build.jobs = 6;
  Builder builder(config_);
  std::string build_dir = config_.BuildDir().string();
  EXPECT_EQ(
      builder.ConfigureCommand(),
      (std::vector<std::string>{
          "cmake", "-DCMAKE_BUILD_TYPE=Release", "-S",
          config_.root_dir.string(), "-B", build_dir}));
  EXPECT_EQ(
      builder.BuildCommand(),
      (std::vector<std::string>{
          "cmake", "--build", build_dir, "--parallel", "6"}));
}

TEST_F(BuilderTest, RunsConfigureThenBuild) {
  fs::path log = Dir() / "calls.log";
  UseFakeCmake(std::format("echo \"$1\" >> '{}'\n", log.string()));
  auto built = Builder(config_).Build();
  ASSERT_TRUE(built.has_value()) << built.error().primary.message;
  auto calls = common::ReadFileText(log);
  ASSERT_TRUE(calls.has_value());
  EXPECT_EQ(*calls, "-DCMAKE_BUILD_TYPE=Debug\n--build\n");
}

TEST_F(BuilderTest, FailedStepIsHostErrorWithStderr) {
  UseFakeCmake("echo 'CMake Error: no CMakeLists.txt' >&2\nexit 1\n");
  auto built = Builder(config_).Build();
  ASSERT_FALSE(built.has_value());
  EXPECT_EQ(built.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      built.error().primary.message.find("exited with code 1"),
      std::string::npos);
  ASSERT_EQ(built.error().notes.size(), 1U);
  EXPECT_EQ(
      built.error().notes[0].message, "CMake Error: no CMakeLists.txt\n");
}

TEST_F(BuilderTest, LongStderrIsTruncated) {
  UseFakeCmake("head -c 1000 /dev/zero | tr '\\0' x >&2\nexit 2\n");
  auto built = Builder(config_).Build();
  ASSERT_FALSE(built.has_value());
  ASSERT_EQ(built.error().notes.size(), 1U);
  EXPECT_EQ(built.error().notes[0].message.size(), kMaxErrorExcerpt);
}

}  // namespace
}  // namespace hwsuite::build
