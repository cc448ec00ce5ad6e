#include "hwsuite/session/input_format.hpp"

#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/repr.hpp"

namespace hwsuite::session {

auto ParseInputMode(std::string_view text) -> Result<InputMode> {
  if (text == "auto") {
    return InputMode::kAuto;
  }
  if (text == "strict") {
    return InputMode::kStrict;
  }
  return std::unexpected(
      Diagnostic::Error(
          std::format("unrecognized stuff mode '{}'", text))
          .WithNote("expected 'auto' or 'strict'"));
}

auto ToString(InputMode mode) -> std::string_view {
  switch (mode) {
    case InputMode::kAuto:
      return "auto";
    case InputMode::kStrict:
      return "strict";
  }
  return "unknown";
}

auto InputFormat::HasSpecialChars(std::string_view line) const -> bool {
  return line.find_first_of(special_chars) != std::string_view::npos;
}

auto InputFormat::EscapeSpecialChars(std::string_view line) const
    -> std::string {
  std::string result;
  result.reserve(line.size());
  for (char ch : line) {
    if (special_chars.find(ch) != std::string::npos) {
      result += std::format("\\{:o}", static_cast<unsigned char>(ch));
    } else {
      result += ch;
    }
  }
  return result;
}

auto InputFormat::FormatLine(std::string_view line) const
    -> Result<std::string> {
  if (mode == InputMode::kStrict) {
    if (HasSpecialChars(line)) {
      return std::unexpected(
          Diagnostic::Error(
              std::format(
                  "input line contains characters that may not be compatible "
                  "with screen `stuff` command: {} has at least one of {}",
                  common::Repr(line), common::Repr(special_chars))));
    }
    return std::string(line);
  }
  std::string formatted = EscapeSpecialChars(line);
  if (formatted.empty() || formatted.back() != '\n') {
    formatted += '\n';
  }
  return formatted;
}

}  // namespace hwsuite::session
