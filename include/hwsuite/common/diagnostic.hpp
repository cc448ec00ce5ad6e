#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace hwsuite {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed fixture or configuration
  kHostError,  // I/O, failed tool invocation
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: user-correctable error (bad fixture name, bad option value)
  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: environment error (missing file, tool exited non-zero)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kWarning, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind == DiagKind::kError ||
           primary.kind == DiagKind::kHostError;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag)
      : diag_(std::move(diag)), what_(FormatWhat(diag_)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return what_.c_str();
  }

 private:
  // "primary (note; note)"
  static auto FormatWhat(const Diagnostic& diag) -> std::string {
    std::string text = diag.primary.message;
    for (std::size_t i = 0; i < diag.notes.size(); ++i) {
      text += i == 0 ? " (" : "; ";
      text += diag.notes[i].message;
    }
    if (!diag.notes.empty()) {
      text += ")";
    }
    return text;
  }

  Diagnostic diag_;
  std::string what_;
};

}  // namespace hwsuite
