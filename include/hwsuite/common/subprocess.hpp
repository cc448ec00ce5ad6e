#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::common {

using Environment = std::map<std::string, std::string>;

// What to execute and where. A relative executable containing a slash is
// resolved against the caller's working directory, not working_dir.
struct ProcessSpec {
  std::filesystem::path executable;
  std::vector<std::string> args;
  std::optional<std::filesystem::path> working_dir;
  // Overlaid on the inherited environment; nullopt inherits unchanged.
  std::optional<Environment> env;

  [[nodiscard]] auto ToArgv() const -> std::vector<std::string>;
};

struct CompletedProcess {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

// Merge overlay into the current environment as KEY=VALUE strings.
auto ResolveEnvironment(const std::optional<Environment>& overlay)
    -> std::vector<std::string>;

// Normal exit yields the exit status; death by signal yields 128 + signo.
auto DecodeWaitStatus(int status) -> int;

// Run to completion with stdin from /dev/null, capturing stdout and stderr
// separately. Fails only if the process could not be started.
auto RunProcess(const ProcessSpec& spec) -> Result<CompletedProcess>;

// Run a tool by name (PATH lookup) in the current directory.
auto RunCommand(const std::vector<std::string>& argv)
    -> Result<CompletedProcess>;

// A spawned child whose stdio is /dev/null. Move-only; the destructor kills
// and reaps a child that is still running.
class ChildProcess {
 public:
  static auto Spawn(const ProcessSpec& spec) -> Result<ChildProcess>;

  ChildProcess(const ChildProcess&) = delete;
  auto operator=(const ChildProcess&) -> ChildProcess& = delete;
  ChildProcess(ChildProcess&& other) noexcept;
  auto operator=(ChildProcess&& other) noexcept -> ChildProcess&;
  ~ChildProcess();

  [[nodiscard]] auto Pid() const -> pid_t {
    return pid_;
  }

  // Exit code if the child has already been reaped.
  [[nodiscard]] auto ExitCode() const -> std::optional<int> {
    return exit_code_;
  }

  // Non-blocking reap.
  auto Poll() -> std::optional<int>;

  // Block up to timeout for the child to exit.
  auto Wait(std::chrono::milliseconds timeout) -> std::optional<int>;

  // SIGTERM, then SIGKILL if still alive after grace. Always reaps.
  auto Terminate(std::chrono::milliseconds grace) -> int;

 private:
  explicit ChildProcess(pid_t pid) : pid_(pid) {
  }

  void Reset() noexcept;

  pid_t pid_ = -1;
  std::optional<int> exit_code_;
};

}  // namespace hwsuite::common
