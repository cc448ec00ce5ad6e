#include "hwsuite/check/outcome.hpp"

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hwsuite::check {

auto ClassificationTag(Classification classification) -> std::string_view {
  switch (classification) {
    case Classification::kOk:
      return "ok";
    case Classification::kEarly:
      return "early";
    case Classification::kFeedFailure:
      return "stuff";
    case Classification::kContentRejected:
      return "content-rejected";
    case Classification::kScreenExit:
      return "screen-exit";
    case Classification::kBadExitCode:
      return "bad-exit-code";
    case Classification::kMemcheck:
      return "memcheck";
    case Classification::kDiff:
      return "diff";
    case Classification::kUnhandled:
      return "unhandled";
  }
  return "unknown";
}

auto Outcome::Make(
    std::filesystem::path executable, fixture::Fixture fixture,
    Classification classification, std::optional<std::string> expected_text,
    std::optional<std::string> actual_text, std::string_view detail)
    -> Outcome {
  std::string_view tag = ClassificationTag(classification);
  return Outcome{
      .passed = classification == Classification::kOk,
      .executable = std::move(executable),
      .fixture = std::move(fixture),
      .expected_text = std::move(expected_text),
      .actual_text = std::move(actual_text),
      .classification = classification,
      .message = detail.empty() ? std::string(tag)
                                : std::format("{}: {}", tag, detail),
  };
}

}  // namespace hwsuite::check
