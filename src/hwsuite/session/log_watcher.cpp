#include "hwsuite/session/log_watcher.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "hwsuite/common/file_io.hpp"

namespace hwsuite::session {

auto HasNonWhitespace(std::string_view text) -> bool {
  return std::ranges::any_of(text, [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) == 0;
  });
}

auto LogWatcher::AwaitOutput(const PollConfig& poll) const -> bool {
  for (int attempt = 0; attempt < poll.limit; ++attempt) {
    std::string text = common::ReadFileTextIfExists(path_).value_or("");
    if (requirement_(text)) {
      return true;
    }
    std::this_thread::sleep_for(poll.interval);
  }
  if (poll.IsEnabled()) {
    spdlog::debug(
        "no output in {} after {} polls", path_.filename().string(),
        poll.limit);
  }
  return false;
}

}  // namespace hwsuite::session
