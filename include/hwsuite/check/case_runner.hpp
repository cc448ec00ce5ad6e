#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hwsuite/check/comparator.hpp"
#include "hwsuite/check/outcome.hpp"
#include "hwsuite/check/policy.hpp"
#include "hwsuite/common/subprocess.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

// Runs single fixtures against one executable. Errors that are not case
// failures (unreadable fixture files, tools that cannot be spawned) are
// thrown as DiagnosticException for the scheduler to convert.
class CaseRunner {
 public:
  CaseRunner(std::filesystem::path executable, RunPolicy policy);
  virtual ~CaseRunner() = default;

  CaseRunner(const CaseRunner&) = delete;
  auto operator=(const CaseRunner&) -> CaseRunner& = delete;
  CaseRunner(CaseRunner&&) = delete;
  auto operator=(CaseRunner&&) -> CaseRunner& = delete;

  virtual auto RunCase(const fixture::Fixture& f) -> Outcome;

  [[nodiscard]] auto Executable() const -> const std::filesystem::path& {
    return executable_;
  }
  [[nodiscard]] auto Policy() const -> const RunPolicy& {
    return policy_;
  }

 protected:
  // Captured output plus whatever the run already decided. exit_code is
  // the subject's, when known.
  struct RunResult {
    std::optional<std::string> output;
    std::optional<Outcome> failure;
    std::optional<int> exit_code;
  };

  auto RunInSession(
      const fixture::Fixture& f, const common::ProcessSpec& spec,
      const std::optional<std::string>& expected_text) -> RunResult;
  auto RunDirect(const fixture::Fixture& f, const common::ProcessSpec& spec)
      -> RunResult;
  auto RunMemcheck(
      const fixture::Fixture& f,
      const std::optional<std::string>& expected_text)
      -> std::optional<Outcome>;

  virtual void Pause(std::chrono::milliseconds duration);

 private:
  std::filesystem::path executable_;
  RunPolicy policy_;
  OutputComparator comparator_;
};

// Valgrind command line for one memcheck run.
auto BuildMemcheckArgs(
    const MemcheckConfig& config, const std::filesystem::path& executable,
    const std::vector<std::string>& args, int error_exit_code)
    -> std::vector<std::string>;

class CaseRunnerFactory {
 public:
  explicit CaseRunnerFactory(RunPolicy policy) : policy_(std::move(policy)) {
  }
  virtual ~CaseRunnerFactory() = default;

  CaseRunnerFactory(const CaseRunnerFactory&) = default;
  auto operator=(const CaseRunnerFactory&) -> CaseRunnerFactory& = default;
  CaseRunnerFactory(CaseRunnerFactory&&) = default;
  auto operator=(CaseRunnerFactory&&) -> CaseRunnerFactory& = default;

  [[nodiscard]] virtual auto Create(std::filesystem::path executable) const
      -> std::unique_ptr<CaseRunner>;

  [[nodiscard]] auto Policy() const -> const RunPolicy& {
    return policy_;
  }

 private:
  RunPolicy policy_;
};

}  // namespace hwsuite::check
