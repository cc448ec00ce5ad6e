#include "hwsuite/check/suite.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fnmatch.h>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/check/outcome.hpp"
#include "hwsuite/check/scheduler.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/discovery.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

namespace fs = std::filesystem;

auto CaseSelection::Matches(const fixture::Fixture& f) const -> bool {
  if (!filter) {
    return true;
  }
  std::string id = f.Identifier();
  if (id.empty()) {
    return true;
  }
  return fnmatch(filter->c_str(), id.c_str(), 0) == 0;
}

auto CaseSelection::Apply(const std::vector<fixture::Fixture>& fixtures) const
    -> std::vector<fixture::Fixture> {
  std::vector<fixture::Fixture> selected;
  for (std::size_t i = 0; i < fixtures.size(); ++i) {
    if (max_cases && i >= *max_cases) {
      spdlog::debug("stopping at case limit {}", *max_cases);
      break;
    }
    if (!Matches(fixtures[i])) {
      spdlog::debug(
          "skipping; filter {} rejected {}", *filter,
          fixtures[i].DisplayName());
      continue;
    }
    selected.push_back(fixtures[i]);
  }
  return selected;
}

auto SuiteChecker::CheckSuite(
    const fs::path& question_dir, const fs::path& executable,
    const CaseSelection& selection) const -> Result<OutcomeMap> {
  std::string name = question_dir.filename().string();
  auto fixtures = fixture::DetectFixtures(question_dir);
  if (!fixtures) {
    return std::unexpected(
        std::move(fixtures.error()).WithNote(std::format("in {}", name)));
  }
  spdlog::info("{}: detected {} test cases", name, fixtures->size());

  std::error_code ec;
  if (!fs::is_regular_file(executable, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("executable not found: {}", executable.string())));
  }

  auto selected = selection.Apply(*fixtures);
  if (selected.empty()) {
    spdlog::warn("{}: all test cases were skipped", name);
    return OutcomeMap{};
  }
  auto runner = factory_.Create(executable);
  Scheduler scheduler(*runner, concurrency_, name);
  return scheduler.RunAll(selected, suite_timeout_);
}

auto ReviewOutcomes(const OutcomeMap& outcomes, std::string_view name)
    -> SuiteSummary {
  SuiteSummary summary{
      .name = std::string(name),
      .total = outcomes.size(),
      .failures = {},
  };
  for (const auto& [fixture, outcome] : outcomes) {
    if (!outcome.passed) {
      summary.failures.push_back(outcome);
    }
  }
  std::ranges::sort(summary.failures, [](const Outcome& a, const Outcome& b) {
    return a.fixture < b.fixture;
  });
  if (!summary.failures.empty()) {
    spdlog::info(
        "{}: {} failures among {} test cases", name, summary.failures.size(),
        summary.total);
  } else if (summary.total > 0) {
    spdlog::info("{}: all {} tests pass", name, summary.total);
  } else {
    spdlog::warn("zero test cases executed for {}", name);
  }
  return summary;
}

}  // namespace hwsuite::check
