#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <semaphore>
#include <string>
#include <vector>

#include "hwsuite/check/case_runner.hpp"
#include "hwsuite/check/outcome.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

inline constexpr auto kDefaultSuiteTimeout = std::chrono::seconds(300);

// hardware_concurrency(), at least 1.
auto DefaultConcurrency() -> int;

// Demangled name of an exception's dynamic type.
auto ExceptionKind(const std::exception& e) -> std::string;

// Runs fixtures on one thread each, with at most `concurrency` cases in
// flight. Outcomes are collected into a map keyed by fixture.
class Scheduler {
 public:
  Scheduler(CaseRunner& runner, int concurrency, std::string suite_name);

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;
  Scheduler(Scheduler&&) = delete;
  auto operator=(Scheduler&&) -> Scheduler& = delete;
  ~Scheduler() = default;

  // Run one case and record its outcome. Exceptions from the runner become
  // an unhandled outcome.
  void Perform(const fixture::Fixture& f, std::size_t index);

  // Start every case and wait for all of them. Cases still running when
  // suite_timeout expires are logged and then waited for anyway.
  auto RunAll(
      const std::vector<fixture::Fixture>& fixtures,
      std::chrono::milliseconds suite_timeout) -> OutcomeMap;

  [[nodiscard]] auto Concurrency() const -> int {
    return concurrency_;
  }

 private:
  void Record(const fixture::Fixture& f, Outcome outcome);

  CaseRunner& runner_;
  int concurrency_;
  std::string suite_name_;
  std::counting_semaphore<> gate_;

  std::mutex mutex_;
  std::condition_variable done_cv_;
  std::size_t completed_ = 0;
  OutcomeMap outcomes_;
};

}  // namespace hwsuite::check
