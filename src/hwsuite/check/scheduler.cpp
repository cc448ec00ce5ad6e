#include "hwsuite/check/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cxxabi.h>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <typeinfo>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/check/outcome.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/fixture/fixture.hpp"

namespace hwsuite::check {

namespace {

// Releases an admission slot on scope exit.
class GateGuard {
 public:
  explicit GateGuard(std::counting_semaphore<>& gate) : gate_(gate) {
    gate_.acquire();
  }
  ~GateGuard() {
    gate_.release();
  }
  GateGuard(const GateGuard&) = delete;
  auto operator=(const GateGuard&) -> GateGuard& = delete;
  GateGuard(GateGuard&&) = delete;
  auto operator=(GateGuard&&) -> GateGuard& = delete;

 private:
  std::counting_semaphore<>& gate_;
};

void LogNested(const std::exception& e, int depth) {
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    spdlog::debug(
        "{:>{}}caused by: {} {}", "", depth * 2, ExceptionKind(nested),
        nested.what());
    LogNested(nested, depth + 1);
  }
}

}  // namespace

auto DefaultConcurrency() -> int {
  return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

auto ExceptionKind(const std::exception& e) -> std::string {
  const char* mangled = typeid(e).name();
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  return demangled.get();
}

Scheduler::Scheduler(
    CaseRunner& runner, int concurrency, std::string suite_name)
    : runner_(runner),
      concurrency_(std::max(1, concurrency)),
      suite_name_(std::move(suite_name)),
      gate_(concurrency_) {
}

void Scheduler::Record(const fixture::Fixture& f, Outcome outcome) {
  {
    std::lock_guard lock(mutex_);
    outcomes_.insert_or_assign(f, std::move(outcome));
    ++completed_;
  }
  done_cv_.notify_all();
}

void Scheduler::Perform(const fixture::Fixture& f, std::size_t index) {
  std::string name = f.DisplayName();
  Outcome outcome;
  try {
    GateGuard admitted(gate_);
    outcome = runner_.RunCase(f);
    if (outcome.passed) {
      spdlog::debug("{}: case {} ({}) passed", suite_name_, index + 1, name);
    } else {
      spdlog::info(
          "{}: case {} ({}) failed: {}", suite_name_, index + 1, name,
          outcome.message);
    }
  } catch (const std::exception& e) {
    std::string kind = ExceptionKind(e);
    spdlog::warn(
        "{}: case {} ({}) unhandled exception: {} {}", suite_name_, index + 1,
        name, kind, e.what());
    LogNested(e, 1);
    outcome = Outcome::Make(
        runner_.Executable(), f, Classification::kUnhandled, std::nullopt,
        std::nullopt, std::format("{} {}", kind, e.what()));
  } catch (...) {
    spdlog::warn(
        "{}: case {} ({}) unhandled exception of unknown type", suite_name_,
        index + 1, name);
    outcome = Outcome::Make(
        runner_.Executable(), f, Classification::kUnhandled, std::nullopt,
        std::nullopt, "unknown");
  }
  Record(f, std::move(outcome));
}

auto Scheduler::RunAll(
    const std::vector<fixture::Fixture>& fixtures,
    std::chrono::milliseconds suite_timeout) -> OutcomeMap {
  {
    std::lock_guard lock(mutex_);
    outcomes_.clear();
    completed_ = 0;
  }
  {
    std::vector<std::jthread> workers;
    workers.reserve(fixtures.size());
    for (std::size_t i = 0; i < fixtures.size(); ++i) {
      workers.emplace_back(
          [this, &fixture = fixtures[i], i] { Perform(fixture, i); });
    }

    std::unique_lock lock(mutex_);
    bool all_done = done_cv_.wait_for(lock, suite_timeout, [&] {
      return completed_ == fixtures.size();
    });
    if (!all_done) {
      spdlog::warn(
          "{}: {} of {} cases still running after {} ms; waiting for them",
          suite_name_, fixtures.size() - completed_, fixtures.size(),
          suite_timeout.count());
    }
    lock.unlock();
    // jthread destructors join the stragglers.
  }
  std::lock_guard lock(mutex_);
  if (outcomes_.size() != fixtures.size()) {
    spdlog::warn(
        "{}: {} cases but {} outcomes (duplicate fixtures?)", suite_name_,
        fixtures.size(), outcomes_.size());
  }
  return std::exchange(outcomes_, {});
}

}  // namespace hwsuite::check
