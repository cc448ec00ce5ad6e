#include "print.hpp"

#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("hwsuite", kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("hwsuite", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("hwsuite", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

}  // namespace hwsuite::driver
