#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hwsuite/common/scoped_temp_directory.hpp"
#include "hwsuite/fixture/discovery.hpp"
#include "hwsuite/fixture/fixture.hpp"
#include "tests/common/test_files.hpp"

namespace hwsuite::fixture {
namespace {

using test::WriteTextFile;

class FixtureDiscoveryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.emplace(common::CreateScopedTempDirectory("discovery_test"));
  }

  [[nodiscard]] auto Dir() const -> const std::filesystem::path& {
    return dir_->Path();
  }

 private:
  std::optional<common::ScopedTempDirectory> dir_;
};

// =============================================================================
// Naming Conventions
// =============================================================================

TEST_F(FixtureDiscoveryTest, BareExpectedMapsToBareCounterparts) {
  auto names = DeriveCounterparts("expected.txt", true);
  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(names->input, "input.txt");
  EXPECT_EQ(names->env, "env.txt");
  EXPECT_EQ(names->args, "args.txt");
}

TEST_F(FixtureDiscoveryTest, SuffixPatternKeepsIdentifier) {
  auto names = DeriveCounterparts("case3-expected.txt", true);
  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(names->input, "case3-input.txt");
  EXPECT_EQ(names->env, "case3-env.txt");
  EXPECT_EQ(names->args, "case3-args.txt");
}

TEST_F(FixtureDiscoveryTest, ExpectedOutputSuffixPattern) {
  auto names = DeriveCounterparts("x-expected-output.txt", true);
  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(names->input, "x-input.txt");
  EXPECT_EQ(names->args, "x-args.txt");
}

TEST_F(FixtureDiscoveryTest, DeprecatedPrefixPattern) {
  auto names = DeriveCounterparts("expected-output7.txt", true);
  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(names->input, "input7.txt");
  EXPECT_EQ(names->env, "env7.txt");
  EXPECT_EQ(names->args, "args7.txt");
}

TEST_F(FixtureDiscoveryTest, UnrecognizedNameIsError) {
  auto names = DeriveCounterparts("output.txt", true);
  ASSERT_FALSE(names.has_value());
  EXPECT_TRUE(names.error().IsError());
}

TEST_F(FixtureDiscoveryTest, IdentifierFollowsExpectedName) {
  Fixture f = MakeExitCodeOnlyFixture();
  EXPECT_EQ(f.Identifier(), "");
  f.expected_file = Dir() / "expected.txt";
  EXPECT_EQ(f.Identifier(), "");
  f.expected_file = Dir() / "abc-expected.txt";
  EXPECT_EQ(f.Identifier(), "abc");
  f.expected_file = Dir() / "abc-expected-output.txt";
  EXPECT_EQ(f.Identifier(), "abc");
  f.expected_file = Dir() / "expected-output12.txt";
  EXPECT_EQ(f.Identifier(), "12");
}

// =============================================================================
// Env and Args Files
// =============================================================================

TEST_F(FixtureDiscoveryTest, EnvSplitsOnFirstEquals) {
  auto env = ParseEnvText("A=1\nB=x=y\r\nFLAG\n\nC=\n");
  EXPECT_EQ(env.size(), 4U);
  EXPECT_EQ(env.at("A"), "1");
  EXPECT_EQ(env.at("B"), "x=y");
  EXPECT_EQ(env.at("FLAG"), "");
  EXPECT_EQ(env.at("C"), "");
}

TEST_F(FixtureDiscoveryTest, ArgsAreOnePerLine) {
  WriteTextFile(Dir() / "args.txt", "--verbose\nhello world\n");
  auto args = ReadArgsFile(Dir() / "args.txt");
  ASSERT_TRUE(args.has_value());
  ASSERT_EQ(args->size(), 2U);
  EXPECT_EQ((*args)[0], "--verbose");
  EXPECT_EQ((*args)[1], "hello world");
}

// =============================================================================
// Directory Scans
// =============================================================================

TEST_F(FixtureDiscoveryTest, OnlyExpectedFileYieldsBareFixture) {
  WriteTextFile(Dir() / "expected.txt", "hi\n");

  auto fixtures = DetectFixtures(Dir());
  ASSERT_TRUE(fixtures.has_value());
  ASSERT_EQ(fixtures->size(), 1U);
  const Fixture& f = fixtures->front();
  ASSERT_TRUE(f.expected_file.has_value());
  EXPECT_EQ(f.expected_file->string(), (Dir() / "expected.txt").string());
  EXPECT_FALSE(f.input_file.has_value());
  EXPECT_FALSE(f.env.has_value());
  EXPECT_TRUE(f.args.empty());
  EXPECT_EQ(f.expected_exit_code, 0);
}

TEST_F(FixtureDiscoveryTest, NoExpectedFilesYieldsExitCodeOnlyFixture) {
  WriteTextFile(Dir() / "main.cpp", "int main() { return 0; }\n");
  WriteTextFile(Dir() / "notes.txt", "nothing\n");

  auto fixtures = DetectFixtures(Dir());
  ASSERT_TRUE(fixtures.has_value());
  ASSERT_EQ(fixtures->size(), 1U);
  EXPECT_TRUE(fixtures->front().IsExitCodeOnly());
  EXPECT_FALSE(fixtures->front().input_file.has_value());
  EXPECT_EQ(fixtures->front().expected_exit_code, 0);
}

TEST_F(FixtureDiscoveryTest, SiblingsAttachedWhenPresent) {
  WriteTextFile(Dir() / "a-expected.txt", "out\n");
  WriteTextFile(Dir() / "a-input.txt", "in\n");
  WriteTextFile(Dir() / "a-env.txt", "K=V\n");
  WriteTextFile(Dir() / "a-args.txt", "one\ntwo\n");

  auto fixtures = DetectFixtures(Dir());
  ASSERT_TRUE(fixtures.has_value());
  ASSERT_EQ(fixtures->size(), 1U);
  const Fixture& f = fixtures->front();
  ASSERT_TRUE(f.input_file.has_value());
  EXPECT_EQ(f.input_file->string(), (Dir() / "a-input.txt").string());
  ASSERT_TRUE(f.env.has_value());
  EXPECT_EQ(f.env->at("K"), "V");
  EXPECT_EQ(f.args, (std::vector<std::string>{"one", "two"}));
}

TEST_F(FixtureDiscoveryTest, ScanIsRecursiveAndSortedByIdentifier) {
  WriteTextFile(Dir() / "c-expected.txt", "c\n");
  WriteTextFile(Dir() / "nested" / "a-expected.txt", "a\n");
  WriteTextFile(Dir() / "b-expected-output.txt", "b\n");

  auto fixtures = DetectFixtures(Dir());
  ASSERT_TRUE(fixtures.has_value());
  ASSERT_EQ(fixtures->size(), 3U);
  EXPECT_EQ((*fixtures)[0].Identifier(), "a");
  EXPECT_EQ((*fixtures)[1].Identifier(), "b");
  EXPECT_EQ((*fixtures)[2].Identifier(), "c");
}

TEST_F(FixtureDiscoveryTest, MissingDirectoryIsError) {
  auto fixtures = DetectFixtures(Dir() / "absent");
  EXPECT_FALSE(fixtures.has_value());
}

}  // namespace
}  // namespace hwsuite::fixture
