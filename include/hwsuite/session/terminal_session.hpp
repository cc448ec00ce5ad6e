#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/subprocess.hpp"
#include "hwsuite/session/input_format.hpp"

namespace hwsuite::session {

// Log file screen writes in its working directory.
inline constexpr std::string_view kScreenLogName = "screenlog.0";
inline constexpr std::string_view kScreenRcName = ".hwsuite-screenrc";
// Written by the shell that wraps the subject once the subject exits.
inline constexpr std::string_view kExitStatusName = ".hwsuite-exit";

enum class SessionState : uint8_t {
  kNotStarted,
  kRunning,
  kTerminatedNormally,
  kTerminatedAbnormally,  // Screen died from a signal
  kKilled,
};

auto ToString(SessionState state) -> std::string_view;

enum class FeedStatus : uint8_t {
  kOk,
  kEarlyTermination,     // Process exited before the line was sent
  kTransmissionFailure,  // The send command failed
  kContentRejected,      // Strict formatting refused the line
};

struct FeedResult {
  FeedStatus status = FeedStatus::kOk;
  std::string message;

  [[nodiscard]] auto Ok() const -> bool {
    return status == FeedStatus::kOk;
  }
};

struct SessionOptions {
  std::filesystem::path screen = "screen";
  std::chrono::milliseconds kill_grace{500};
  bool log_input = false;
};

// One subject process running inside a detached GNU screen session, with
// terminal output captured to kScreenLogName in the working directory.
class TerminalSession {
 public:
  // spec.working_dir is required.
  TerminalSession(common::ProcessSpec spec, SessionOptions options);
  ~TerminalSession();

  TerminalSession(const TerminalSession&) = delete;
  auto operator=(const TerminalSession&) -> TerminalSession& = delete;
  TerminalSession(TerminalSession&&) = delete;
  auto operator=(TerminalSession&&) -> TerminalSession& = delete;

  // Spawn screen; does not wait for the subject.
  auto Start() -> Result<void>;

  // Send one line as if typed. Nothing is sent once the process has exited.
  auto Feed(std::string_view line, const InputFormat& format) -> FeedResult;

  // Send ^D.
  auto SendEndOfInput() -> FeedResult;

  // Wait up to timeout for screen to exit. Returns false on timeout, leaving
  // the session running.
  auto AwaitTermination(std::chrono::milliseconds timeout) -> bool;

  // Ask screen to end the session. A session that is already gone counts as
  // success.
  auto Quit() -> bool;

  // SIGTERM, then SIGKILL after the grace period. Returns the exit code.
  auto Kill() -> std::optional<int>;

  // Captured terminal output. A missing log is nullopt when tolerated and an
  // error otherwise.
  [[nodiscard]] auto ReadLog(bool tolerate_missing) const
      -> Result<std::optional<std::string>>;

  [[nodiscard]] auto State() const -> SessionState {
    return state_;
  }
  [[nodiscard]] auto IsRunning() const -> bool {
    return state_ == SessionState::kRunning;
  }
  [[nodiscard]] auto HasFinished() const -> bool;
  // Exit code of screen itself, once reaped.
  [[nodiscard]] auto ExitCode() const -> std::optional<int>;
  // Exit code of the subject, or nullopt if it never finished (still
  // running, or torn down with the session).
  [[nodiscard]] auto SubjectExitCode() const -> Result<std::optional<int>>;
  [[nodiscard]] auto SessionName() const -> const std::string& {
    return session_name_;
  }
  [[nodiscard]] auto LogPath() const -> std::filesystem::path;
  [[nodiscard]] auto FeedCount() const -> int {
    return feed_count_;
  }

 private:
  // Reap without blocking; updates state_ if screen exited.
  auto PollExit() -> bool;
  void RecordExit(int exit_code);
  auto SendStuff(const std::string& payload) -> FeedResult;
  // After a failed send: true if the session ended meanwhile.
  auto SessionEnded(const common::CompletedProcess& send) -> bool;
  void Teardown() noexcept;

  common::ProcessSpec spec_;
  SessionOptions options_;
  std::string session_name_;
  std::optional<common::ChildProcess> child_;
  SessionState state_ = SessionState::kNotStarted;
  int feed_count_ = 0;
};

// Unique per process and per call.
auto MakeSessionName() -> std::string;

}  // namespace hwsuite::session
