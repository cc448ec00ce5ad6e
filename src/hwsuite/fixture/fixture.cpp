#include "hwsuite/fixture/fixture.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace hwsuite::fixture {

namespace {

constexpr std::string_view kBareExpected = "expected.txt";
constexpr std::string_view kDeprecatedPrefix = "expected-output";

auto TrimSuffix(std::string_view text, std::string_view suffix)
    -> std::optional<std::string_view> {
  if (text.size() < suffix.size() || !text.ends_with(suffix)) {
    return std::nullopt;
  }
  return text.substr(0, text.size() - suffix.size());
}

}  // namespace

auto Fixture::Identifier() const -> std::string {
  if (!expected_file) {
    return "";
  }
  std::string basename = expected_file->filename().string();
  if (basename == kBareExpected) {
    return "";
  }
  for (std::string_view suffix : {"-expected-output.txt", "-expected.txt"}) {
    if (auto id = TrimSuffix(basename, suffix)) {
      return std::string(*id);
    }
  }
  if (basename.starts_with(kDeprecatedPrefix)) {
    std::string_view rest =
        std::string_view(basename).substr(kDeprecatedPrefix.size());
    return std::string(TrimSuffix(rest, ".txt").value_or(rest));
  }
  return basename;
}

auto Fixture::DisplayName() const -> std::string {
  if (!expected_file) {
    return "<exit-code>";
  }
  if (input_file) {
    return input_file->filename().string();
  }
  return expected_file->filename().string();
}

auto MakeExitCodeOnlyFixture() -> Fixture {
  return Fixture{
      .input_file = std::nullopt,
      .expected_file = std::nullopt,
      .env = std::nullopt,
      .args = {},
      .expected_exit_code = 0,
  };
}

}  // namespace hwsuite::fixture
