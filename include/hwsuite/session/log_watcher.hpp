#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string_view>
#include <utility>

namespace hwsuite::session {

// Poll at a fixed interval, at most `limit` times. A zero limit disables
// polling.
struct PollConfig {
  std::chrono::milliseconds interval{1000};
  int limit = 0;

  static auto Disabled() -> PollConfig {
    return PollConfig{.interval = std::chrono::milliseconds(1000), .limit = 0};
  }

  [[nodiscard]] auto IsEnabled() const -> bool {
    return limit > 0;
  }
};

// Decides whether captured output is ready.
using OutputRequirement = std::function<bool(std::string_view)>;

// Satisfied by any non-whitespace character.
auto HasNonWhitespace(std::string_view text) -> bool;

inline const OutputRequirement kDefaultOutputRequirement = HasNonWhitespace;

// Waits for a log file to satisfy a requirement.
class LogWatcher {
 public:
  explicit LogWatcher(
      std::filesystem::path path,
      OutputRequirement requirement = kDefaultOutputRequirement)
      : path_(std::move(path)), requirement_(std::move(requirement)) {
  }

  // Returns true once satisfied, false if the poll limit ran out.
  auto AwaitOutput(const PollConfig& poll) const -> bool;

 private:
  std::filesystem::path path_;
  OutputRequirement requirement_;
};

}  // namespace hwsuite::session
