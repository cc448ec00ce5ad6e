#include "hwsuite/check/policy.hpp"

#include <chrono>
#include <cmath>
#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

namespace {

auto ParseApplicability(std::string_view text)
    -> Result<MemcheckApplicability> {
  if (text == "auto") {
    return MemcheckApplicability::kAuto;
  }
  if (text == "always") {
    return MemcheckApplicability::kAlways;
  }
  if (text == "never") {
    return MemcheckApplicability::kNever;
  }
  return std::unexpected(
      Diagnostic::Error(
          std::format("memcheck: invalid applicability '{}'", text)));
}

auto ParseVerbosity(std::string_view text) -> Result<MemcheckVerbosity> {
  if (text == "normal") {
    return MemcheckVerbosity::kNormal;
  }
  if (text == "quiet") {
    return MemcheckVerbosity::kQuiet;
  }
  return std::unexpected(
      Diagnostic::Error(
          std::format("memcheck: invalid verbosity '{}'", text)));
}

}  // namespace

auto ToMilliseconds(double seconds) -> std::chrono::milliseconds {
  return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

auto ParseSessionRequirement(std::string_view text)
    -> Result<SessionRequirement> {
  if (text == "auto") {
    return SessionRequirement::kAuto;
  }
  if (text == "always") {
    return SessionRequirement::kAlways;
  }
  if (text == "never") {
    return SessionRequirement::kNever;
  }
  return std::unexpected(
      Diagnostic::Error(
          std::format("invalid screen requirement '{}'", text))
          .WithNote("expected 'auto', 'always' or 'never'"));
}

auto UsesSession(SessionRequirement requirement, const fixture::Fixture& f)
    -> bool {
  switch (requirement) {
    case SessionRequirement::kAlways:
      return true;
    case SessionRequirement::kNever:
      return false;
    case SessionRequirement::kAuto:
      break;
  }
  return f.input_file.has_value();
}

auto MemcheckConfig::AppliesTo(const fixture::Fixture& f) const -> bool {
  switch (applicability) {
    case MemcheckApplicability::kAlways:
      return true;
    case MemcheckApplicability::kNever:
      return false;
    case MemcheckApplicability::kAuto:
      break;
  }
  return !f.input_file.has_value();
}

auto ParseMemcheckConfig(std::string_view text) -> Result<MemcheckConfig> {
  MemcheckConfig config;
  while (!text.empty()) {
    auto amp = text.find('&');
    std::string_view pair = text.substr(0, amp);
    text = amp == std::string_view::npos ? std::string_view{}
                                         : text.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    std::string_view key = pair.substr(0, eq);
    std::string_view value =
        eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
    if (key == "applicability") {
      auto parsed = ParseApplicability(value);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.applicability = *parsed;
    } else if (key == "verbosity") {
      auto parsed = ParseVerbosity(value);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.verbosity = *parsed;
    } else if (key == "executable") {
      if (value.empty()) {
        return std::unexpected(
            Diagnostic::Error("memcheck: executable must not be empty"));
      }
      config.executable = std::string(value);
    } else {
      return std::unexpected(
          Diagnostic::Error(std::format("memcheck: unknown key '{}'", key))
              .WithNote("known keys: applicability, verbosity, executable"));
    }
  }
  return config;
}

}  // namespace hwsuite::check
