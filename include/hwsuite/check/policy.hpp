#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/fixture.hpp"
#include "hwsuite/session/input_format.hpp"
#include "hwsuite/session/log_watcher.hpp"

namespace hwsuite::check {

inline constexpr auto kDefaultPause = std::chrono::milliseconds(500);
inline constexpr auto kDefaultProcessingTimeout = std::chrono::seconds(5);
inline constexpr int kDefaultAwaitLimit = 10;

// Pacing for session runs.
struct Throttle {
  std::chrono::milliseconds pause = kDefaultPause;
  session::PollConfig await = session::PollConfig::Disabled();
  std::chrono::milliseconds processing_timeout = kDefaultProcessingTimeout;
};

// Seconds from config files and flags.
auto ToMilliseconds(double seconds) -> std::chrono::milliseconds;

enum class SessionRequirement : uint8_t {
  kAuto,  // Only when the fixture has input
  kAlways,
  kNever,
};

auto ParseSessionRequirement(std::string_view text)
    -> Result<SessionRequirement>;
auto UsesSession(SessionRequirement requirement, const fixture::Fixture& f)
    -> bool;

enum class MemcheckApplicability : uint8_t {
  kAuto,  // Only fixtures without input
  kAlways,
  kNever,
};

enum class MemcheckVerbosity : uint8_t {
  kNormal,
  kQuiet,
};

inline constexpr int kMemcheckErrorExitCode = 99;

// Valgrind's error exit code for a fixture; never the code the fixture
// expects from the subject.
constexpr auto MemcheckErrorExitCode(int expected_exit_code) -> int {
  return expected_exit_code == kMemcheckErrorExitCode
             ? kMemcheckErrorExitCode - 1
             : kMemcheckErrorExitCode;
}

struct MemcheckConfig {
  MemcheckApplicability applicability = MemcheckApplicability::kNever;
  MemcheckVerbosity verbosity = MemcheckVerbosity::kNormal;
  std::filesystem::path executable = "valgrind";

  [[nodiscard]] auto AppliesTo(const fixture::Fixture& f) const -> bool;
};

// Parse "key=value&key=value" with keys applicability, verbosity and
// executable. Unknown keys or values are errors.
auto ParseMemcheckConfig(std::string_view text) -> Result<MemcheckConfig>;

// Everything a case runner needs besides the executable.
struct RunPolicy {
  Throttle throttle;
  session::InputFormat input_format;
  SessionRequirement session_requirement = SessionRequirement::kAuto;
  MemcheckConfig memcheck;
  std::filesystem::path screen = "screen";
  bool log_input = false;
};

}  // namespace hwsuite::check
