#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"

namespace hwsuite::build {

// Stderr kept in a build failure diagnostic.
inline constexpr std::size_t kMaxErrorExcerpt = 256;

// Configures and builds the project with CMake.
class Builder {
 public:
  explicit Builder(const config::ProjectConfig& config) : config_(config) {
  }

  [[nodiscard]] auto ConfigureCommand() const -> std::vector<std::string>;
  [[nodiscard]] auto BuildCommand() const -> std::vector<std::string>;

  // Run configure then build; the first failing step is the error.
  auto Build() const -> Result<void>;

 private:
  auto RunStep(const std::vector<std::string>& argv) const -> Result<void>;

  const config::ProjectConfig& config_;
};

}  // namespace hwsuite::build
