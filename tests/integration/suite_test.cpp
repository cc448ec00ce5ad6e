#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/check/case_runner.hpp"
#include "hwsuite/check/outcome.hpp"
#include "hwsuite/check/policy.hpp"
#include "hwsuite/check/suite.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/scoped_temp_directory.hpp"
#include "hwsuite/fixture/fixture.hpp"
#include "tests/common/test_files.hpp"

namespace hwsuite::check {
namespace {

namespace fs = std::filesystem;
using test::WriteScript;
using test::WriteTextFile;

// Echoes its arguments, one per line.
constexpr std::string_view kEchoArgs =
    "for a in \"$@\"; do echo \"$a\"; done\n";

class SuiteTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.emplace(common::CreateScopedTempDirectory("suite_test"));
    policy_.session_requirement = SessionRequirement::kNever;
    WriteScript(Executable(), std::string(kEchoArgs));
  }

  [[nodiscard]] auto QuestionDir() const -> fs::path {
    return dir_->Path() / "q1";
  }

  [[nodiscard]] auto Executable() const -> fs::path {
    return dir_->Path() / "bin" / "q1";
  }

  void AddCase(
      const std::string& id, const std::string& args,
      const std::string& expected) const {
    fs::path tests = QuestionDir() / "test-cases";
    WriteTextFile(tests / (id + "-args.txt"), args);
    WriteTextFile(tests / (id + "-expected-output.txt"), expected);
  }

  RunPolicy policy_;

 private:
  std::optional<common::ScopedTempDirectory> dir_;
};

TEST_F(SuiteTest, RunsEveryDiscoveredCase) {
  AddCase("a", "x\n", "x\n");
  AddCase("b", "y\nz\n", "y\nz\n");
  AddCase("c", "1\n", "2\n");
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 2);
  auto outcomes = checker.CheckSuite(QuestionDir(), Executable(), {});
  ASSERT_TRUE(outcomes.has_value()) << outcomes.error().primary.message;
  ASSERT_EQ(outcomes->size(), 3U);

  SuiteSummary summary = ReviewOutcomes(*outcomes, "q1");
  EXPECT_EQ(summary.total, 3U);
  ASSERT_EQ(summary.failures.size(), 1U);
  EXPECT_FALSE(summary.Passed());
  EXPECT_EQ(summary.failures[0].fixture.Identifier(), "c");
  EXPECT_EQ(summary.failures[0].classification, Classification::kDiff);
}

TEST_F(SuiteTest, NoFixturesMeansExitCodeOnly) {
  WriteTextFile(QuestionDir() / "main.cpp", "int main() {}\n");
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 1);
  auto outcomes = checker.CheckSuite(QuestionDir(), Executable(), {});
  ASSERT_TRUE(outcomes.has_value());
  ASSERT_EQ(outcomes->size(), 1U);
  EXPECT_TRUE(outcomes->begin()->second.passed);
  EXPECT_TRUE(outcomes->begin()->first.IsExitCodeOnly());
}

TEST_F(SuiteTest, SelectionLimitsAndFilters) {
  AddCase("a", "x\n", "x\n");
  AddCase("b", "y\n", "y\n");
  AddCase("c", "z\n", "z\n");
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 2);

  auto limited = checker.CheckSuite(
      QuestionDir(), Executable(),
      CaseSelection{.max_cases = 2, .filter = std::nullopt});
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 2U);

  auto filtered = checker.CheckSuite(
      QuestionDir(), Executable(),
      CaseSelection{.max_cases = std::nullopt, .filter = "[bc]"});
  ASSERT_TRUE(filtered.has_value());
  ASSERT_EQ(filtered->size(), 2U);
  for (const auto& [f, outcome] : *filtered) {
    EXPECT_NE(f.Identifier(), "a");
  }
}

TEST_F(SuiteTest, FilterRejectingEverythingYieldsNoOutcomes) {
  AddCase("a", "x\n", "x\n");
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 1);
  auto outcomes = checker.CheckSuite(
      QuestionDir(), Executable(),
      CaseSelection{.max_cases = std::nullopt, .filter = "zzz"});
  ASSERT_TRUE(outcomes.has_value());
  EXPECT_TRUE(outcomes->empty());
  EXPECT_TRUE(ReviewOutcomes(*outcomes, "q1").Passed());
}

TEST_F(SuiteTest, MissingExecutableIsHostError) {
  AddCase("a", "x\n", "x\n");
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 1);
  auto outcomes = checker.CheckSuite(
      QuestionDir(), QuestionDir() / "cmake-build" / "q1", {});
  ASSERT_FALSE(outcomes.has_value());
  EXPECT_EQ(outcomes.error().primary.kind, DiagKind::kHostError);
}

TEST_F(SuiteTest, MissingQuestionDirectoryAbortsSuite) {
  CaseRunnerFactory factory(policy_);
  SuiteChecker checker(factory, 1);
  auto outcomes = checker.CheckSuite(
      QuestionDir() / "absent", Executable(), CaseSelection{});
  ASSERT_FALSE(outcomes.has_value());
  ASSERT_EQ(outcomes.error().notes.size(), 1U);
  EXPECT_EQ(outcomes.error().notes[0].message, "in absent");
}

}  // namespace
}  // namespace hwsuite::check
