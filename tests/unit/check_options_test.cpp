#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "hwsuite/check/policy.hpp"
#include "hwsuite/check/report.hpp"
#include "hwsuite/config/project_config.hpp"
#include "hwsuite/session/input_format.hpp"
#include "src/hwsuite/driver/check_options.hpp"

namespace hwsuite::driver {
namespace {

using namespace std::chrono_literals;

class CheckOptionsTest : public ::testing::Test {
 protected:
  config::ProjectConfig config_ = config::DefaultConfig("/tmp");
};

TEST_F(CheckOptionsTest, DefaultsComeFromConfig) {
  config_.check.threads = 3;
  auto options = ResolveCheckOptions(config_, CheckOverrides{});
  ASSERT_TRUE(options.has_value()) << options.error().primary.message;
  EXPECT_EQ(options->policy.throttle.pause, 500ms);
  EXPECT_EQ(options->policy.throttle.processing_timeout, 5000ms);
  EXPECT_FALSE(options->policy.throttle.await.IsEnabled());
  EXPECT_EQ(options->policy.input_format.mode, session::InputMode::kAuto);
  EXPECT_EQ(options->policy.input_format.special_chars, "^#");
  EXPECT_FALSE(options->policy.input_format.eof);
  EXPECT_EQ(
      options->policy.session_requirement, check::SessionRequirement::kAuto);
  EXPECT_EQ(
      options->policy.memcheck.applicability,
      check::MemcheckApplicability::kNever);
  EXPECT_EQ(options->report, check::ReportFormat::kDiff);
  EXPECT_EQ(options->concurrency, 3);
  EXPECT_EQ(options->suite_timeout, 300000ms);
}

TEST_F(CheckOptionsTest, OverridesWin) {
  CheckOverrides overrides;
  overrides.pause = 0.05;
  overrides.max_cases = 2;
  overrides.threads = 1;
  overrides.filter = "case*";
  overrides.report = "repr";
  overrides.stuff = "strict";
  overrides.eof = true;
  overrides.await_interval = 0.2;
  overrides.require_screen = "never";
  overrides.log_input = true;
  auto options = ResolveCheckOptions(config_, overrides);
  ASSERT_TRUE(options.has_value()) << options.error().primary.message;
  EXPECT_EQ(options->policy.throttle.pause, 50ms);
  ASSERT_TRUE(options->policy.throttle.await.IsEnabled());
  EXPECT_EQ(options->policy.throttle.await.interval, 200ms);
  EXPECT_EQ(options->policy.throttle.await.limit, 10);
  EXPECT_EQ(options->policy.input_format.mode, session::InputMode::kStrict);
  EXPECT_TRUE(options->policy.input_format.eof);
  EXPECT_EQ(
      options->policy.session_requirement, check::SessionRequirement::kNever);
  EXPECT_TRUE(options->policy.log_input);
  EXPECT_EQ(options->report, check::ReportFormat::kRepr);
  EXPECT_EQ(options->selection.max_cases, 2U);
  EXPECT_EQ(options->selection.filter, "case*");
  EXPECT_EQ(options->concurrency, 1);
}

TEST_F(CheckOptionsTest, ZeroThreadsMeansHardwareConcurrency) {
  auto options = ResolveCheckOptions(config_, CheckOverrides{});
  ASSERT_TRUE(options.has_value());
  EXPECT_GE(options->concurrency, 1);
}

TEST_F(CheckOptionsTest, ToolPathsFlowIntoPolicy) {
  config_.executables.screen = "/opt/screen";
  config_.executables.valgrind = "/opt/valgrind";
  auto options = ResolveCheckOptions(config_, CheckOverrides{});
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->policy.screen.string(), "/opt/screen");
  EXPECT_EQ(options->policy.memcheck.executable.string(), "/opt/valgrind");
}

TEST_F(CheckOptionsTest, MemcheckExecutableBeatsToolPath) {
  config_.executables.valgrind = "/opt/valgrind";
  CheckOverrides overrides;
  overrides.memcheck = "applicability=always&executable=/usr/local/vg";
  auto options = ResolveCheckOptions(config_, overrides);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(
      options->policy.memcheck.applicability,
      check::MemcheckApplicability::kAlways);
  EXPECT_EQ(options->policy.memcheck.executable.string(), "/usr/local/vg");
}

// =============================================================================
// Rejected Values
// =============================================================================

TEST_F(CheckOptionsTest, BadReportFormat) {
  CheckOverrides overrides;
  overrides.report = "html";
  EXPECT_FALSE(ResolveCheckOptions(config_, overrides).has_value());
}

TEST_F(CheckOptionsTest, BadInputMode) {
  CheckOverrides overrides;
  overrides.stuff = "loose";
  EXPECT_FALSE(ResolveCheckOptions(config_, overrides).has_value());
}

TEST_F(CheckOptionsTest, BadScreenRequirement) {
  config_.check.require_screen = "sometimes";
  EXPECT_FALSE(ResolveCheckOptions(config_, CheckOverrides{}).has_value());
}

TEST_F(CheckOptionsTest, BadMemcheckKey) {
  CheckOverrides overrides;
  overrides.memcheck = "tool=helgrind";
  auto options = ResolveCheckOptions(config_, overrides);
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(
      options.error().primary.message, "memcheck: unknown key 'tool'");
}

TEST_F(CheckOptionsTest, NegativePause) {
  CheckOverrides overrides;
  overrides.pause = -0.5;
  EXPECT_FALSE(ResolveCheckOptions(config_, overrides).has_value());
}

TEST_F(CheckOptionsTest, NegativeThreads) {
  CheckOverrides overrides;
  overrides.threads = -2;
  EXPECT_FALSE(ResolveCheckOptions(config_, overrides).has_value());
}

}  // namespace
}  // namespace hwsuite::driver
