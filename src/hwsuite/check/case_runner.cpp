#include "hwsuite/check/case_runner.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/check/outcome.hpp"
#include "hwsuite/check/policy.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/file_io.hpp"
#include "hwsuite/common/scoped_temp_directory.hpp"
#include "hwsuite/common/subprocess.hpp"
#include "hwsuite/fixture/fixture.hpp"
#include "hwsuite/session/log_watcher.hpp"
#include "hwsuite/session/terminal_session.hpp"

namespace hwsuite::check {

namespace {

template <typename T>
auto ValueOrThrow(Result<T> result) -> T {
  if (!result) {
    throw DiagnosticException(std::move(result.error()));
  }
  return *std::move(result);
}

auto FeedFailureClassification(session::FeedStatus status) -> Classification {
  switch (status) {
    case session::FeedStatus::kEarlyTermination:
      return Classification::kEarly;
    case session::FeedStatus::kContentRejected:
      return Classification::kContentRejected;
    case session::FeedStatus::kTransmissionFailure:
    case session::FeedStatus::kOk:
      break;
  }
  return Classification::kFeedFailure;
}

// Quit gracefully; kill only if quit failed and screen is still alive.
void FinishSession(session::TerminalSession& session) {
  if (!session.Quit() && !session.HasFinished()) {
    session.Kill();
  }
}

}  // namespace

auto BuildMemcheckArgs(
    const MemcheckConfig& config, const std::filesystem::path& executable,
    const std::vector<std::string>& args, int error_exit_code)
    -> std::vector<std::string> {
  std::vector<std::string> argv{
      "--leak-check=full",
      std::format("--error-exitcode={}", error_exit_code),
  };
  if (config.verbosity == MemcheckVerbosity::kQuiet) {
    argv.emplace_back("-q");
  }
  argv.emplace_back("--");
  argv.push_back(executable.string());
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

CaseRunner::CaseRunner(std::filesystem::path executable, RunPolicy policy)
    : executable_(std::move(executable)), policy_(std::move(policy)) {
  // The subject runs in its own temp directory.
  if (executable_.has_parent_path() && executable_.is_relative()) {
    executable_ = std::filesystem::absolute(executable_);
  }
}

void CaseRunner::Pause(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

auto CaseRunner::RunCase(const fixture::Fixture& f) -> Outcome {
  bool use_session = UsesSession(policy_.session_requirement, f);
  spdlog::debug(
      "{}: use_session={} for input {}", f.DisplayName(), use_session,
      f.input_file ? f.input_file->filename().string() : "<none>");

  std::optional<std::string> expected_text;
  if (f.expected_file) {
    expected_text = ValueOrThrow(common::ReadFileText(*f.expected_file));
  }

  auto make_outcome = [&](Classification classification,
                          std::optional<std::string> actual,
                          std::string_view detail = {}) {
    return Outcome::Make(
        executable_, f, classification, expected_text, std::move(actual),
        detail);
  };

  RunResult run;
  {
    auto tempdir = common::CreateScopedTempDirectory("case");
    common::ProcessSpec spec{
        .executable = executable_,
        .args = f.args,
        .working_dir = tempdir.Path(),
        .env = f.env,
    };
    run = use_session ? RunInSession(f, spec, expected_text)
                      : RunDirect(f, spec);
  }
  if (run.failure) {
    return *std::move(run.failure);
  }
  if (run.exit_code && !f.CheckExitCode(*run.exit_code)) {
    return make_outcome(
        Classification::kBadExitCode, std::move(run.output),
        std::format("unexpected exit code {}", *run.exit_code));
  }

  if (policy_.memcheck.AppliesTo(f)) {
    if (auto failure = RunMemcheck(f, expected_text)) {
      return *std::move(failure);
    }
  }

  if (!expected_text) {
    return make_outcome(Classification::kOk, std::move(run.output));
  }
  std::string actual = run.output.value_or("");
  Comparison comparison = comparator_.Compare(*expected_text, actual);
  if (comparison.matched) {
    return make_outcome(Classification::kOk, std::move(actual));
  }
  return make_outcome(Classification::kDiff, std::move(actual));
}

auto CaseRunner::RunInSession(
    const fixture::Fixture& f, const common::ProcessSpec& spec,
    const std::optional<std::string>& expected_text) -> RunResult {
  std::vector<std::string> lines;
  if (f.input_file) {
    lines = ValueOrThrow(common::ReadFileLines(*f.input_file, false));
  }

  session::TerminalSession session(
      spec, session::SessionOptions{
                .screen = policy_.screen,
                .kill_grace = std::chrono::milliseconds(500),
                .log_input = policy_.log_input,
            });
  ValueOrThrow(session.Start());
  const Throttle& throttle = policy_.throttle;
  Pause(throttle.pause * 2);

  spdlog::debug(
      "{}: feeding {} lines to {}", f.DisplayName(), lines.size(),
      executable_.filename().string());
  session::LogWatcher(session.LogPath()).AwaitOutput(throttle.await);
  for (const auto& line : lines) {
    Pause(throttle.pause);
    auto fed = session.Feed(line, policy_.input_format);
    if (!fed.Ok()) {
      auto actual = session.ReadLog(true).value_or(std::nullopt);
      FinishSession(session);
      return RunResult{
          .output = actual,
          .failure = Outcome::Make(
              executable_, f, FeedFailureClassification(fed.status),
              expected_text, actual, fed.message),
          .exit_code = std::nullopt,
      };
    }
  }
  if (policy_.input_format.eof) {
    auto sent = session.SendEndOfInput();
    if (!sent.Ok()) {
      spdlog::debug(
          "{}: end of input not sent: {}", f.DisplayName(), sent.message);
    }
  }
  spdlog::debug(
      "{}: waiting {} ms for process to terminate", f.DisplayName(),
      throttle.processing_timeout.count());
  bool terminated = session.AwaitTermination(throttle.processing_timeout);
  FinishSession(session);

  auto log = ValueOrThrow(session.ReadLog(false));
  std::string output = log.value_or("");
  std::optional<int> screen_exit =
      terminated ? session.ExitCode() : std::nullopt;
  if (screen_exit && *screen_exit != 0) {
    return RunResult{
        .output = output,
        .failure = Outcome::Make(
            executable_, f, Classification::kScreenExit, expected_text,
            output,
            std::format(
                "screen -D -m {} exit code {}", executable_.string(),
                *screen_exit)),
        .exit_code = std::nullopt,
    };
  }
  std::optional<int> exit_code = ValueOrThrow(session.SubjectExitCode());
  if (!exit_code) {
    spdlog::debug(
        "{}: exit code of {} unavailable", f.DisplayName(),
        executable_.filename().string());
  }
  return RunResult{
      .output = std::move(output),
      .failure = std::nullopt,
      .exit_code = exit_code,
  };
}

auto CaseRunner::RunDirect(
    const fixture::Fixture& f, const common::ProcessSpec& spec) -> RunResult {
  auto completed = ValueOrThrow(common::RunProcess(spec));
  if (!completed.stderr_text.empty()) {
    spdlog::debug(
        "{}: stderr of {}:\n{}", f.DisplayName(),
        executable_.filename().string(), completed.stderr_text);
  }
  return RunResult{
      .output = std::move(completed.stdout_text),
      .failure = std::nullopt,
      .exit_code = completed.exit_code,
  };
}

auto CaseRunner::RunMemcheck(
    const fixture::Fixture& f, const std::optional<std::string>& expected_text)
    -> std::optional<Outcome> {
  auto tempdir = common::CreateScopedTempDirectory("memcheck");
  int error_exit_code = MemcheckErrorExitCode(f.expected_exit_code);
  common::ProcessSpec spec{
      .executable = policy_.memcheck.executable,
      .args = BuildMemcheckArgs(
          policy_.memcheck, executable_, f.args, error_exit_code),
      .working_dir = tempdir.Path(),
      .env = f.env,
  };
  auto completed = ValueOrThrow(common::RunProcess(spec));
  if (completed.exit_code == f.expected_exit_code &&
      completed.exit_code != error_exit_code) {
    return std::nullopt;
  }
  spdlog::debug(
      "{}: memcheck stderr:\n{}", f.DisplayName(), completed.stderr_text);
  return Outcome::Make(
      executable_, f, Classification::kMemcheck, expected_text,
      completed.stdout_text,
      std::format(
          "{} exit code {}", policy_.memcheck.executable.filename().string(),
          completed.exit_code));
}

auto CaseRunnerFactory::Create(std::filesystem::path executable) const
    -> std::unique_ptr<CaseRunner> {
  return std::make_unique<CaseRunner>(std::move(executable), policy_);
}

}  // namespace hwsuite::check
