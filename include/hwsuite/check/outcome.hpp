#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <absl/container/flat_hash_map.h>

#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

// Why a case passed or failed. The first applicable classification wins.
enum class Classification : uint8_t {
  kOk,
  kEarly,
  kFeedFailure,
  kContentRejected,
  kScreenExit,
  kBadExitCode,
  kMemcheck,
  kDiff,
  kUnhandled,
};

// Tag that leads every outcome message, e.g. "bad-exit-code".
auto ClassificationTag(Classification classification) -> std::string_view;

struct Outcome {
  bool passed = false;
  std::filesystem::path executable;
  fixture::Fixture fixture;
  std::optional<std::string> expected_text;
  std::optional<std::string> actual_text;
  Classification classification = Classification::kUnhandled;
  std::string message;

  // Message is the tag, or "<tag>: <detail>".
  static auto Make(
      std::filesystem::path executable, fixture::Fixture fixture,
      Classification classification, std::optional<std::string> expected_text,
      std::optional<std::string> actual_text, std::string_view detail = {})
      -> Outcome;
};

using OutcomeMap = absl::flat_hash_map<fixture::Fixture, Outcome>;

}  // namespace hwsuite::check
