#include "hwsuite/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <optional>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"

extern char** environ;

namespace hwsuite::common {
namespace {

constexpr auto kReapInterval = std::chrono::milliseconds(10);

// Everything the child needs, materialized before fork() so the child only
// makes async-signal-safe calls.
struct ExecImage {
  std::vector<std::string> argv_storage;
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;
  std::string working_dir;

  explicit ExecImage(const ProcessSpec& spec)
      : argv_storage(spec.ToArgv()),
        env_storage(ResolveEnvironment(spec.env)),
        working_dir(spec.working_dir ? spec.working_dir->string() : "") {
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }
};

// Redirect stdio and exec. Never returns.
[[noreturn]] void ExecChild(
    const ExecImage& image, int stdout_fd, int stderr_fd) {
  int null_fd = open("/dev/null", O_RDWR);
  if (null_fd < 0) {
    _exit(127);
  }
  dup2(null_fd, STDIN_FILENO);
  dup2(stdout_fd >= 0 ? stdout_fd : null_fd, STDOUT_FILENO);
  dup2(stderr_fd >= 0 ? stderr_fd : null_fd, STDERR_FILENO);
  if (null_fd > STDERR_FILENO) {
    close(null_fd);
  }
  if (!image.working_dir.empty() && chdir(image.working_dir.c_str()) != 0) {
    _exit(127);
  }
  execvpe(image.argv[0], image.argv.data(), image.envp.data());
  _exit(127);
}

void CloseIfOpen(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drain both pipes until EOF on each.
void DrainPipes(int out_fd, int err_fd, std::string& out, std::string& err) {
  std::array<char, 4096> buffer{};
  std::array<pollfd, 2> fds{
      pollfd{.fd = out_fd, .events = POLLIN, .revents = 0},
      pollfd{.fd = err_fd, .events = POLLIN, .revents = 0},
  };
  int open_count = 2;
  while (open_count > 0) {
    int ready = poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        (i == 0 ? out : err).append(buffer.data(), static_cast<size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      close(fds[i].fd);
      fds[i].fd = -1;
      --open_count;
    }
  }
}

auto WaitBlocking(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return DecodeWaitStatus(status);
}

}  // namespace

auto ProcessSpec::ToArgv() const -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(executable.string());
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

auto ResolveEnvironment(const std::optional<Environment>& overlay)
    -> std::vector<std::string> {
  Environment merged;
  for (char** entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    std::string_view kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    merged.emplace(
        std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
  }
  if (overlay) {
    for (const auto& [key, value] : *overlay) {
      merged[key] = value;
    }
  }
  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    result.push_back(key + "=" + value);
  }
  return result;
}

auto DecodeWaitStatus(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto RunProcess(const ProcessSpec& spec) -> Result<CompletedProcess> {
  ExecImage image(spec);

  std::array<int, 2> out_pipe{-1, -1};
  std::array<int, 2> err_pipe{-1, -1};
  if (pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("pipe() failed: {}", std::strerror(errno))));
  }
  if (pipe2(err_pipe.data(), O_CLOEXEC) != 0) {
    int saved = errno;
    CloseIfOpen(out_pipe[0]);
    CloseIfOpen(out_pipe[1]);
    return std::unexpected(
        Diagnostic::HostError(
            std::format("pipe() failed: {}", std::strerror(saved))));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
      CloseIfOpen(*fd);
    }
    return std::unexpected(
        Diagnostic::HostError(
            std::format("fork() failed: {}", std::strerror(saved))));
  }
  if (pid == 0) {
    ExecChild(image, out_pipe[1], err_pipe[1]);
  }

  CloseIfOpen(out_pipe[1]);
  CloseIfOpen(err_pipe[1]);

  CompletedProcess completed;
  DrainPipes(out_pipe[0], err_pipe[0], completed.stdout_text,
             completed.stderr_text);
  completed.exit_code = WaitBlocking(pid);
  return completed;
}

auto RunCommand(const std::vector<std::string>& argv)
    -> Result<CompletedProcess> {
  if (argv.empty()) {
    return std::unexpected(Diagnostic::HostError("empty command line"));
  }
  ProcessSpec spec{
      .executable = argv.front(),
      .args = std::vector<std::string>(argv.begin() + 1, argv.end()),
      .working_dir = std::nullopt,
      .env = std::nullopt,
  };
  return RunProcess(spec);
}

auto ChildProcess::Spawn(const ProcessSpec& spec) -> Result<ChildProcess> {
  ExecImage image(spec);
  pid_t pid = fork();
  if (pid < 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("fork() failed: {}", std::strerror(errno))));
  }
  if (pid == 0) {
    ExecChild(image, -1, -1);
  }
  return ChildProcess(pid);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)) {
}

auto ChildProcess::operator=(ChildProcess&& other) noexcept -> ChildProcess& {
  if (this != &other) {
    Reset();
    pid_ = std::exchange(other.pid_, -1);
    exit_code_ = std::exchange(other.exit_code_, std::nullopt);
  }
  return *this;
}

ChildProcess::~ChildProcess() {
  Reset();
}

void ChildProcess::Reset() noexcept {
  if (pid_ > 0 && !exit_code_) {
    kill(pid_, SIGKILL);
    WaitBlocking(pid_);
  }
  pid_ = -1;
  exit_code_.reset();
}

auto ChildProcess::Poll() -> std::optional<int> {
  if (exit_code_ || pid_ <= 0) {
    return exit_code_;
  }
  int status = 0;
  pid_t reaped = waitpid(pid_, &status, WNOHANG);
  if (reaped == pid_) {
    exit_code_ = DecodeWaitStatus(status);
  }
  return exit_code_;
}

auto ChildProcess::Wait(std::chrono::milliseconds timeout)
    -> std::optional<int> {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!Poll()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(kReapInterval);
  }
  return exit_code_;
}

auto ChildProcess::Terminate(std::chrono::milliseconds grace) -> int {
  if (Poll()) {
    return *exit_code_;
  }
  kill(pid_, SIGTERM);
  if (Wait(grace)) {
    return *exit_code_;
  }
  kill(pid_, SIGKILL);
  exit_code_ = WaitBlocking(pid_);
  return *exit_code_;
}

}  // namespace hwsuite::common
