#pragma once

#include <argparse/argparse.hpp>

namespace hwsuite::driver {

inline constexpr int kExitOk = 0;
inline constexpr int kExitConfigError = 2;
inline constexpr int kExitCaseFailures = 3;

void AddCommonFlags(argparse::ArgumentParser& cmd);
void AddCheckFlags(argparse::ArgumentParser& cmd);

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto BuildCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace hwsuite::driver
