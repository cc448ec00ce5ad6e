#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hwsuite::check {

// Produces an alternate expected text for a known capture artifact, or
// nullopt when the artifact cannot apply. Arguments are (expected, actual).
using ExpectedTransform = std::function<std::optional<std::string>(
    std::string_view, std::string_view)>;

inline constexpr std::size_t kDefaultTabSize = 8;

// Expand tabs to the next multiple of tab_size, restarting at each newline.
auto ExpandTabs(std::string_view text, std::size_t tab_size = kDefaultTabSize)
    -> std::string;

// Rewrite bare LF as CRLF.
auto ToCrlf(std::string_view text) -> std::string;

// Screen renders tabs as spaces.
auto TabExpansionCandidate(std::string_view expected, std::string_view actual)
    -> std::optional<std::string>;

// The pty translates LF to CRLF on output.
auto CrlfCandidate(std::string_view expected, std::string_view actual)
    -> std::optional<std::string>;

inline const ExpectedTransform kExpandTabsTransform = TabExpansionCandidate;
inline const ExpectedTransform kCrlfTransform = CrlfCandidate;

struct Comparison {
  bool matched = false;
  // The expected candidate that matched, or the last one tried.
  std::string expected_candidate;
  int comparisons = 0;
};

// Compares captured output with expected text, also trying alternate
// expected candidates. The captured text is never rewritten.
class OutputComparator {
 public:
  OutputComparator() : OutputComparator(DefaultTransforms()) {
  }
  explicit OutputComparator(std::vector<ExpectedTransform> transforms)
      : transforms_(std::move(transforms)) {
  }

  static auto DefaultTransforms() -> std::vector<ExpectedTransform> {
    return {kExpandTabsTransform, kCrlfTransform};
  }

  // Raw expected first, then each transform applied to every candidate
  // gathered so far, without duplicates.
  [[nodiscard]] auto ExpectedCandidates(
      std::string_view expected, std::string_view actual) const
      -> std::vector<std::string>;

  [[nodiscard]] auto Compare(
      std::string_view expected, std::string_view actual) const -> Comparison;

 private:
  std::vector<ExpectedTransform> transforms_;
};

}  // namespace hwsuite::check
