#include "check_options.hpp"

#include <chrono>
#include <expected>
#include <format>
#include <string>

#include "hwsuite/check/policy.hpp"
#include "hwsuite/check/report.hpp"
#include "hwsuite/check/scheduler.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"
#include "hwsuite/session/input_format.hpp"
#include "hwsuite/session/log_watcher.hpp"

namespace hwsuite::driver {

auto ResolveCheckOptions(
    const config::ProjectConfig& config, const CheckOverrides& overrides)
    -> Result<CheckOptions> {
  const config::CheckSettings& settings = config.check;
  CheckOptions options;

  double pause = overrides.pause.value_or(settings.pause);
  if (pause < 0.0) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("pause must not be negative: {}", pause)));
  }
  double await_interval =
      overrides.await_interval.value_or(settings.await_interval);
  options.policy.throttle = check::Throttle{
      .pause = check::ToMilliseconds(pause),
      .await = await_interval > 0.0
                   ? session::PollConfig{
                         .interval = check::ToMilliseconds(await_interval),
                         .limit = settings.await_limit,
                     }
                   : session::PollConfig::Disabled(),
      .processing_timeout =
          check::ToMilliseconds(settings.processing_timeout),
  };

  auto mode =
      session::ParseInputMode(overrides.stuff.value_or(settings.stuff));
  if (!mode) {
    return std::unexpected(mode.error());
  }
  options.policy.input_format = session::InputFormat{
      .mode = *mode,
      .special_chars = settings.special_chars,
      .eof = overrides.eof.value_or(settings.eof),
  };

  auto requirement = check::ParseSessionRequirement(
      overrides.require_screen.value_or(settings.require_screen));
  if (!requirement) {
    return std::unexpected(requirement.error());
  }
  options.policy.session_requirement = *requirement;

  std::string memcheck_text = overrides.memcheck.value_or(settings.memcheck);
  auto memcheck = check::ParseMemcheckConfig(memcheck_text);
  if (!memcheck) {
    return std::unexpected(memcheck.error());
  }
  // An explicit memcheck executable wins over [executables].
  if (!memcheck_text.contains("executable=")) {
    memcheck->executable = config.executables.valgrind;
  }
  options.policy.memcheck = *memcheck;
  options.policy.screen = config.executables.screen;
  options.policy.log_input = overrides.log_input;

  auto report = check::ParseReportFormat(
      overrides.report.value_or(settings.report));
  if (!report) {
    return std::unexpected(report.error());
  }
  options.report = *report;

  options.selection = check::CaseSelection{
      .max_cases = overrides.max_cases,
      .filter = overrides.filter,
  };

  int threads = overrides.threads.value_or(settings.threads);
  if (threads < 0) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("thread count must not be negative: {}", threads)));
  }
  options.concurrency = threads == 0 ? check::DefaultConcurrency() : threads;
  options.suite_timeout = check::ToMilliseconds(settings.suite_timeout);
  return options;
}

}  // namespace hwsuite::driver
