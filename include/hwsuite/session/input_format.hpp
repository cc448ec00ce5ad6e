#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::session {

// Characters that screen's `stuff` command interprets.
inline constexpr std::string_view kDefaultSpecialChars = "^#";

enum class InputMode : uint8_t {
  kAuto,    // Escape special characters, ensure a trailing newline
  kStrict,  // Reject lines containing special characters
};

auto ParseInputMode(std::string_view text) -> Result<InputMode>;
auto ToString(InputMode mode) -> std::string_view;

// How recorded input lines are prepared for transmission.
struct InputFormat {
  InputMode mode = InputMode::kAuto;
  std::string special_chars = std::string(kDefaultSpecialChars);
  // Send ^D after the last line.
  bool eof = false;

  [[nodiscard]] auto HasSpecialChars(std::string_view line) const -> bool;

  // Replace each special character with a backslash-octal escape.
  [[nodiscard]] auto EscapeSpecialChars(std::string_view line) const
      -> std::string;

  // Auto mode: escaped line ending in exactly the newline it had, or one
  // appended. Strict mode: the line unchanged, or an error if it holds a
  // special character.
  [[nodiscard]] auto FormatLine(std::string_view line) const
      -> Result<std::string>;
};

}  // namespace hwsuite::session
