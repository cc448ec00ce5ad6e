#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>

#include "commands.hpp"
#include "print.hpp"

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("hwsuite", "0.1.0");
  program.add_description("Build and check homework executables");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Build, then run test cases for each question");
  hwsuite::driver::AddCommonFlags(check_cmd);
  hwsuite::driver::AddCheckFlags(check_cmd);

  // Subcommand: build
  argparse::ArgumentParser build_cmd("build");
  build_cmd.add_description("Configure and build the project with CMake");
  hwsuite::driver::AddCommonFlags(build_cmd);

  program.add_subparser(check_cmd);
  program.add_subparser(build_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    hwsuite::driver::PrintError(err.what());
    std::cerr << program;
    return hwsuite::driver::kExitConfigError;
  }

  if (program.is_subcommand_used("check")) {
    return hwsuite::driver::CheckCommand(check_cmd);
  }
  if (program.is_subcommand_used("build")) {
    return hwsuite::driver::BuildCommand(build_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return hwsuite::driver::kExitOk;
}
