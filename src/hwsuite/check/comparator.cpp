#include "hwsuite/check/comparator.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace hwsuite::check {

auto ExpandTabs(std::string_view text, std::size_t tab_size) -> std::string {
  std::string out;
  out.reserve(text.size());
  std::size_t column = 0;
  for (char ch : text) {
    if (ch == '\t') {
      std::size_t spaces = tab_size == 0 ? 0 : tab_size - (column % tab_size);
      out.append(spaces, ' ');
      column += spaces;
    } else if (ch == '\n' || ch == '\r') {
      out += ch;
      column = 0;
    } else {
      out += ch;
      ++column;
    }
  }
  return out;
}

auto ToCrlf(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size() + text.size() / 16);
  char prev = '\0';
  for (char ch : text) {
    if (ch == '\n' && prev != '\r') {
      out += '\r';
    }
    out += ch;
    prev = ch;
  }
  return out;
}

auto TabExpansionCandidate(std::string_view expected, std::string_view actual)
    -> std::optional<std::string> {
  static_cast<void>(actual);
  if (expected.find('\t') == std::string_view::npos) {
    return std::nullopt;
  }
  return ExpandTabs(expected);
}

auto CrlfCandidate(std::string_view expected, std::string_view actual)
    -> std::optional<std::string> {
  if (actual.find("\r\n") == std::string_view::npos ||
      expected.find('\n') == std::string_view::npos) {
    return std::nullopt;
  }
  return ToCrlf(expected);
}

auto OutputComparator::ExpectedCandidates(
    std::string_view expected, std::string_view actual) const
    -> std::vector<std::string> {
  std::vector<std::string> candidates{std::string(expected)};
  for (const auto& transform : transforms_) {
    size_t existing = candidates.size();
    for (size_t i = 0; i < existing; ++i) {
      auto candidate = transform(candidates[i], actual);
      if (candidate && std::ranges::find(candidates, *candidate) ==
                           candidates.end()) {
        candidates.push_back(*std::move(candidate));
      }
    }
  }
  return candidates;
}

auto OutputComparator::Compare(
    std::string_view expected, std::string_view actual) const -> Comparison {
  Comparison result;
  for (auto& candidate : ExpectedCandidates(expected, actual)) {
    ++result.comparisons;
    result.matched = candidate == actual;
    result.expected_candidate = std::move(candidate);
    if (result.matched) {
      return result;
    }
  }
  spdlog::debug("no equal texts after {} comparisons", result.comparisons);
  return result;
}

}  // namespace hwsuite::check
