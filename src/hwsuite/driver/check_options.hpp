#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "hwsuite/check/policy.hpp"
#include "hwsuite/check/report.hpp"
#include "hwsuite/check/suite.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"

namespace hwsuite::driver {

// Values given on the command line; unset fields fall back to the project
// configuration.
struct CheckOverrides {
  std::optional<double> pause;
  std::optional<std::size_t> max_cases;
  std::optional<int> threads;
  std::optional<std::string> filter;
  std::optional<std::string> report;
  std::optional<std::string> stuff;
  std::optional<bool> eof;
  std::optional<double> await_interval;
  std::optional<std::string> require_screen;
  std::optional<std::string> memcheck;
  bool log_input = false;
};

struct CheckOptions {
  check::RunPolicy policy;
  check::CaseSelection selection;
  check::ReportFormat report = check::ReportFormat::kDiff;
  int concurrency = 1;
  std::chrono::milliseconds suite_timeout = check::kDefaultSuiteTimeout;
};

// Merge overrides onto the config and validate every enumerated value.
auto ResolveCheckOptions(
    const config::ProjectConfig& config, const CheckOverrides& overrides)
    -> Result<CheckOptions>;

}  // namespace hwsuite::driver
