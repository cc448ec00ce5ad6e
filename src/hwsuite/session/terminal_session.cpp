#include "hwsuite/session/terminal_session.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/file_io.hpp"
#include "hwsuite/common/repr.hpp"
#include "hwsuite/common/subprocess.hpp"
#include "hwsuite/session/input_format.hpp"

namespace hwsuite::session {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kNoSessionMessage = "No screen session found";
constexpr auto kQuitReapTimeout = std::chrono::milliseconds(1000);
// How long a failed send waits to see whether screen is exiting.
constexpr auto kSendReapTimeout = std::chrono::milliseconds(200);

// Flush the log on every write so pre-feed polling sees prompts immediately.
constexpr std::string_view kScreenRcText = "logfile flush 0\n";

// Runs the subject ("$@") and records its exit status in the working
// directory, exiting with the same status.
auto ExitStatusScript() -> std::string {
  return std::format(
      R"("$@"; status=$?; echo "$status" > {}; exit "$status")",
      kExitStatusName);
}

auto ReportsNoSession(const common::CompletedProcess& completed) -> bool {
  return completed.stdout_text.contains(kNoSessionMessage) ||
         completed.stderr_text.contains(kNoSessionMessage);
}

auto RandomHex() -> std::string {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return std::format("{:08x}", static_cast<uint32_t>(engine()));
}

}  // namespace

auto ToString(SessionState state) -> std::string_view {
  switch (state) {
    case SessionState::kNotStarted:
      return "not-started";
    case SessionState::kRunning:
      return "running";
    case SessionState::kTerminatedNormally:
      return "terminated-normally";
    case SessionState::kTerminatedAbnormally:
      return "terminated-abnormally";
    case SessionState::kKilled:
      return "killed";
  }
  return "unknown";
}

auto MakeSessionName() -> std::string {
  static std::atomic<uint64_t> counter{0};
  return std::format(
      "hwsuite-{}-{}-{}", getpid(), counter.fetch_add(1), RandomHex());
}

TerminalSession::TerminalSession(
    common::ProcessSpec spec, SessionOptions options)
    : spec_(std::move(spec)),
      options_(std::move(options)),
      session_name_(MakeSessionName()) {
}

TerminalSession::~TerminalSession() {
  Teardown();
}

auto TerminalSession::LogPath() const -> fs::path {
  return spec_.working_dir.value_or(fs::current_path()) / kScreenLogName;
}

auto TerminalSession::HasFinished() const -> bool {
  return state_ != SessionState::kNotStarted &&
         state_ != SessionState::kRunning;
}

auto TerminalSession::ExitCode() const -> std::optional<int> {
  if (!child_) {
    return std::nullopt;
  }
  return child_->ExitCode();
}

auto TerminalSession::SubjectExitCode() const -> Result<std::optional<int>> {
  if (!spec_.working_dir) {
    return std::optional<int>{};
  }
  fs::path path = *spec_.working_dir / kExitStatusName;
  auto text = common::ReadFileTextIfExists(path);
  if (!text) {
    return std::optional<int>{};
  }
  std::string_view digits = *text;
  while (!digits.empty() && (digits.back() == '\n' || digits.back() == ' ')) {
    digits.remove_suffix(1);
  }
  int code = 0;
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), code);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "malformed exit status {} in {}", common::Repr(*text),
                path.string())));
  }
  return code;
}

auto TerminalSession::Start() -> Result<void> {
  if (state_ != SessionState::kNotStarted) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("session {} already started", session_name_)));
  }
  if (!spec_.working_dir) {
    return std::unexpected(
        Diagnostic::Error("screen session requires a working directory"));
  }

  fs::path rc_path = *spec_.working_dir / kScreenRcName;
  auto written = common::WriteFileText(rc_path, std::string(kScreenRcText));
  if (!written) {
    return std::unexpected(written.error());
  }

  common::Environment env = spec_.env.value_or(common::Environment{});
  if (std::getenv("TERM") == nullptr && !env.contains("TERM")) {
    env["TERM"] = "xterm";
  }

  std::vector<std::string> args{
      "-c", rc_path.string(), "-L", "-S", session_name_, "-D", "-m", "--",
      "/bin/sh", "-c", ExitStatusScript(), "sh"};
  for (auto& part : spec_.ToArgv()) {
    args.push_back(std::move(part));
  }
  common::ProcessSpec screen_spec{
      .executable = options_.screen,
      .args = std::move(args),
      .working_dir = spec_.working_dir,
      .env = std::move(env),
  };

  auto child = common::ChildProcess::Spawn(screen_spec);
  if (!child) {
    return std::unexpected(child.error());
  }
  child_.emplace(*std::move(child));
  state_ = SessionState::kRunning;
  spdlog::debug(
      "started screen session {} (pid {}) for {}", session_name_,
      child_->Pid(), spec_.executable.filename().string());
  return {};
}

void TerminalSession::RecordExit(int exit_code) {
  if (state_ != SessionState::kRunning) {
    return;
  }
  state_ = exit_code >= 128 ? SessionState::kTerminatedAbnormally
                            : SessionState::kTerminatedNormally;
  spdlog::debug(
      "screen session {} exited with code {}", session_name_, exit_code);
}

auto TerminalSession::PollExit() -> bool {
  if (!child_) {
    return false;
  }
  if (auto code = child_->Poll()) {
    RecordExit(*code);
    return true;
  }
  return false;
}

auto TerminalSession::SendStuff(const std::string& payload) -> FeedResult {
  auto completed = common::RunCommand(
      {options_.screen.string(), "-S", session_name_, "-X", "stuff", payload});
  if (!completed) {
    return FeedResult{
        .status = FeedStatus::kTransmissionFailure,
        .message = completed.error().primary.message,
    };
  }
  if (completed->exit_code != 0) {
    if (SessionEnded(*completed)) {
      return FeedResult{
          .status = FeedStatus::kEarlyTermination,
          .message = "session ended while input was being sent",
      };
    }
    return FeedResult{
        .status = FeedStatus::kTransmissionFailure,
        .message = std::format(
            "stuff exit code {}; stderr={}; stdout={}", completed->exit_code,
            common::Repr(completed->stderr_text),
            common::Repr(completed->stdout_text)),
    };
  }
  return FeedResult{};
}

auto TerminalSession::SessionEnded(const common::CompletedProcess& send)
    -> bool {
  if (ReportsNoSession(send) || PollExit()) {
    return true;
  }
  if (auto code = child_->Wait(kSendReapTimeout)) {
    RecordExit(*code);
    return true;
  }
  return false;
}

auto TerminalSession::Feed(std::string_view line, const InputFormat& format)
    -> FeedResult {
  if (state_ == SessionState::kNotStarted) {
    return FeedResult{
        .status = FeedStatus::kTransmissionFailure,
        .message = "session not started",
    };
  }
  if (HasFinished() || PollExit()) {
    return FeedResult{
        .status = FeedStatus::kEarlyTermination,
        .message = std::format(
            "process exited before line {} was fed", feed_count_ + 1),
    };
  }
  auto formatted = format.FormatLine(line);
  if (!formatted) {
    return FeedResult{
        .status = FeedStatus::kContentRejected,
        .message = formatted.error().primary.message,
    };
  }
  if (options_.log_input) {
    spdlog::debug(
        "[{}] feeding line {}: {}", session_name_, feed_count_ + 1,
        common::Repr(*formatted));
  }
  auto result = SendStuff(*formatted);
  if (!result.Ok()) {
    spdlog::info(
        "[{}] feeding line {} failed: {}", session_name_, feed_count_ + 1,
        result.message);
    return result;
  }
  ++feed_count_;
  return result;
}

auto TerminalSession::SendEndOfInput() -> FeedResult {
  if (!IsRunning() || PollExit()) {
    return FeedResult{
        .status = FeedStatus::kEarlyTermination,
        .message = "process exited before end of input was sent",
    };
  }
  auto result = SendStuff("^D");
  if (!result.Ok()) {
    spdlog::info(
        "[{}] sending end of input failed: {}", session_name_, result.message);
  }
  return result;
}

auto TerminalSession::AwaitTermination(std::chrono::milliseconds timeout)
    -> bool {
  if (!child_) {
    return false;
  }
  if (HasFinished()) {
    return true;
  }
  if (auto code = child_->Wait(timeout)) {
    RecordExit(*code);
    return true;
  }
  spdlog::warn(
      "process did not terminate before timeout of {} ms elapsed",
      timeout.count());
  return false;
}

auto TerminalSession::Quit() -> bool {
  if (!IsRunning()) {
    return true;
  }
  spdlog::debug("quitting screen session {}", session_name_);
  auto completed = common::RunCommand(
      {options_.screen.string(), "-S", session_name_, "-X", "quit"});
  if (!completed) {
    spdlog::warn(
        "screen 'quit' could not run: {}", completed.error().primary.message);
    return PollExit();
  }
  if (completed->exit_code != 0) {
    if (ReportsNoSession(*completed) || PollExit()) {
      return true;
    }
    spdlog::warn("screen 'quit' failed with code {}", completed->exit_code);
    return false;
  }
  if (auto code = child_->Wait(kQuitReapTimeout)) {
    RecordExit(*code);
  }
  return true;
}

auto TerminalSession::Kill() -> std::optional<int> {
  if (!child_) {
    spdlog::info("no screen process retained for {}", session_name_);
    return std::nullopt;
  }
  if (PollExit()) {
    return child_->ExitCode();
  }
  spdlog::info("terminating screen process {}", child_->Pid());
  int code = child_->Terminate(options_.kill_grace);
  state_ = SessionState::kKilled;
  spdlog::info("after term/kill attempt, exit code = {}", code);
  return code;
}

auto TerminalSession::ReadLog(bool tolerate_missing) const
    -> Result<std::optional<std::string>> {
  auto text = common::ReadFileTextIfExists(LogPath());
  if (text) {
    return text;
  }
  if (tolerate_missing) {
    return std::optional<std::string>{};
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::format("screen log not found: {}", LogPath().string())));
}

void TerminalSession::Teardown() noexcept {
  if (!IsRunning()) {
    return;
  }
  try {
    if (!Quit() && IsRunning()) {
      Kill();
    }
  } catch (const std::exception& e) {
    spdlog::error("teardown of {} failed: {}", session_name_, e.what());
  }
}

}  // namespace hwsuite::session
