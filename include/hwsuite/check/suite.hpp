#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/check/case_runner.hpp"
#include "hwsuite/check/outcome.hpp"
#include "hwsuite/check/scheduler.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

// Which discovered fixtures to run.
struct CaseSelection {
  std::optional<std::size_t> max_cases;
  // Shell glob matched against the fixture identifier.
  std::optional<std::string> filter;

  // Fixtures with an empty identifier always match.
  [[nodiscard]] auto Matches(const fixture::Fixture& f) const -> bool;

  // First max_cases in discovery order, then the filter.
  [[nodiscard]] auto Apply(const std::vector<fixture::Fixture>& fixtures) const
      -> std::vector<fixture::Fixture>;
};

struct SuiteSummary {
  std::string name;
  std::size_t total = 0;
  // Failed outcomes in fixture order.
  std::vector<Outcome> failures;

  [[nodiscard]] auto Passed() const -> bool {
    return failures.empty();
  }
};

// Checks every fixture of one question against its executable.
class SuiteChecker {
 public:
  SuiteChecker(
      const CaseRunnerFactory& factory, int concurrency,
      std::chrono::milliseconds suite_timeout = kDefaultSuiteTimeout)
      : factory_(factory),
        concurrency_(concurrency),
        suite_timeout_(suite_timeout) {
  }

  // Discovery errors and a missing executable abort the suite.
  auto CheckSuite(
      const std::filesystem::path& question_dir,
      const std::filesystem::path& executable,
      const CaseSelection& selection) const -> Result<OutcomeMap>;

 private:
  const CaseRunnerFactory& factory_;
  int concurrency_;
  std::chrono::milliseconds suite_timeout_;
};

// Log totals and collect failures.
auto ReviewOutcomes(const OutcomeMap& outcomes, std::string_view name)
    -> SuiteSummary;

}  // namespace hwsuite::check
