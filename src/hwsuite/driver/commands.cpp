#include "commands.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "check_options.hpp"
#include "hwsuite/build/builder.hpp"
#include "hwsuite/check/case_runner.hpp"
#include "hwsuite/check/report.hpp"
#include "hwsuite/check/suite.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "questions.hpp"

namespace hwsuite::driver {

namespace fs = std::filesystem;

namespace {

auto SetUpLogging(const argparse::ArgumentParser& cmd) -> bool {
  auto level = ParseLogLevel(cmd.get<std::string>("--log-level"));
  if (!level) {
    PrintDiagnostic(level.error());
    return false;
  }
  ConfigureLogging(*level);
  return true;
}

// hwsuite.toml from --project-dir, or found by walking up from the current
// directory. An explicit directory without one gets defaults.
auto LoadProjectConfig(const argparse::ArgumentParser& cmd)
    -> Result<config::ProjectConfig> {
  if (auto dir = cmd.present<std::string>("--project-dir")) {
    fs::path project_dir = fs::absolute(*dir);
    if (!fs::is_directory(project_dir)) {
      return std::unexpected(
          Diagnostic::Error(
              std::format("not a directory: {}", project_dir.string())));
    }
    fs::path config_path = project_dir / config::kConfigFileName;
    if (fs::exists(config_path)) {
      return config::LoadConfig(config_path);
    }
    spdlog::debug(
        "no {} in {}; using defaults", config::kConfigFileName,
        project_dir.string());
    return config::DefaultConfig(project_dir);
  }
  auto config_path = config::FindConfig();
  if (!config_path) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("{} not found", config::kConfigFileName))
            .WithNote("run from inside a project or pass --project-dir"));
  }
  spdlog::debug("using {}", config_path->string());
  return config::LoadConfig(*config_path);
}

auto ReadOverrides(const argparse::ArgumentParser& cmd) -> CheckOverrides {
  CheckOverrides overrides;
  overrides.pause = cmd.present<double>("--pause");
  if (auto max_cases = cmd.present<int>("--max-cases")) {
    if (*max_cases < 0) {
      PrintWarning(std::format("--max-cases {} treated as 0", *max_cases));
    }
    overrides.max_cases = static_cast<std::size_t>(std::max(0, *max_cases));
  }
  overrides.threads = cmd.present<int>("--threads");
  overrides.filter = cmd.present<std::string>("--filter");
  overrides.report = cmd.present<std::string>("--report");
  overrides.stuff = cmd.present<std::string>("--stuff");
  if (cmd.get<bool>("--eof")) {
    overrides.eof = true;
  }
  overrides.await_interval = cmd.present<double>("--await");
  overrides.require_screen = cmd.present<std::string>("--require-screen");
  overrides.memcheck = cmd.present<std::string>("--memcheck");
  overrides.log_input = cmd.get<bool>("--log-input");
  return overrides;
}

}  // namespace

void AddCommonFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-l", "--log-level")
      .default_value(std::string("INFO"))
      .help("Log level: DEBUG, INFO, WARNING or ERROR")
      .metavar("LEVEL");
  cmd.add_argument("--project-dir")
      .help("Project directory (if not found from the current directory)")
      .metavar("DIR");
}

void AddCheckFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-p", "--pause")
      .scan<'g', double>()
      .help("Pause between input lines (seconds)")
      .metavar("DURATION");
  cmd.add_argument("-m", "--max-cases")
      .scan<'i', int>()
      .help("Run at most N test cases per question")
      .metavar("N");
  cmd.add_argument("-j", "-t", "--threads")
      .scan<'i', int>()
      .help("Concurrency level for test cases; default is CPU count")
      .metavar("N");
  cmd.add_argument("--filter")
      .help("Run only test cases whose identifier matches PATTERN")
      .metavar("PATTERN");
  cmd.add_argument("--report")
      .help("What to print on failure: diff, full, repr or none")
      .metavar("ACTION");
  cmd.add_argument("--stuff")
      .help("How input lines are sent to screen: auto or strict")
      .metavar("MODE");
  cmd.add_argument("--eof")
      .default_value(false)
      .implicit_value(true)
      .help("Send end of input after the last line");
  cmd.add_argument("--await")
      .scan<'g', double>()
      .help("Poll at INTERVAL for output before sending input")
      .metavar("INTERVAL");
  cmd.add_argument("--require-screen")
      .help("When to run under screen: auto, always or never")
      .metavar("MODE");
  cmd.add_argument("--memcheck")
      .help("Memory check settings, e.g. applicability=auto&verbosity=quiet")
      .metavar("KEY=VALUE[&...]");
  cmd.add_argument("--no-build")
      .default_value(false)
      .implicit_value(true)
      .help("Skip the build step");
  cmd.add_argument("--log-input")
      .default_value(false)
      .implicit_value(true)
      .help("Log each fed input line at DEBUG level");
  cmd.add_argument("subdirs").remaining().help(
      "Question directories to check; all if none given");
}

auto BuildCommand(const argparse::ArgumentParser& cmd) -> int {
  if (!SetUpLogging(cmd)) {
    return kExitConfigError;
  }
  auto config = LoadProjectConfig(cmd);
  if (!config) {
    PrintDiagnostic(config.error());
    return kExitConfigError;
  }
  auto built = build::Builder(*config).Build();
  if (!built) {
    PrintDiagnostic(built.error());
    return kExitConfigError;
  }
  return kExitOk;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  if (!SetUpLogging(cmd)) {
    return kExitConfigError;
  }
  auto config = LoadProjectConfig(cmd);
  if (!config) {
    PrintDiagnostic(config.error());
    return kExitConfigError;
  }
  auto options = ResolveCheckOptions(*config, ReadOverrides(cmd));
  if (!options) {
    PrintDiagnostic(options.error());
    return kExitConfigError;
  }

  if (!cmd.get<bool>("--no-build")) {
    auto built = build::Builder(*config).Build();
    if (!built) {
      PrintDiagnostic(built.error());
      return kExitConfigError;
    }
  }

  std::vector<std::string> subdirs;
  if (auto given = cmd.present<std::vector<std::string>>("subdirs")) {
    subdirs = *given;
  }
  auto questions = FindQuestions(*config, subdirs);
  if (!questions) {
    PrintDiagnostic(questions.error());
    return kExitConfigError;
  }
  if (questions->empty()) {
    PrintError(std::format("no {} files found", kMainSource));
    return kExitConfigError;
  }

  check::CaseRunnerFactory factory(options->policy);
  check::SuiteChecker checker(
      factory, options->concurrency, options->suite_timeout);
  bool had_error = false;
  std::size_t total_failures = 0;
  for (const auto& question : *questions) {
    fs::path executable = ResolveExecutable(*config, question);
    auto outcomes =
        checker.CheckSuite(question.dir, executable, options->selection);
    if (!outcomes) {
      PrintDiagnostic(outcomes.error());
      had_error = true;
      continue;
    }
    auto summary = check::ReviewOutcomes(*outcomes, question.name);
    check::WriteReport(std::cout, summary.failures, options->report);
    total_failures += summary.failures.size();
  }
  std::cout.flush();

  if (had_error) {
    return kExitConfigError;
  }
  return total_failures == 0 ? kExitOk : kExitCaseFailures;
}

}  // namespace hwsuite::driver
