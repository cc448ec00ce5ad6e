#include "questions.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/config/project_config.hpp"

namespace hwsuite::driver {

namespace fs = std::filesystem;

namespace {

auto MakeQuestion(const fs::path& root, const fs::path& dir) -> Question {
  fs::path absolute = fs::absolute(dir).lexically_normal();
  return Question{
      .name = absolute.filename().string(),
      .dir = absolute,
      .relative_dir = absolute.lexically_relative(root),
  };
}

}  // namespace

auto FindQuestions(
    const config::ProjectConfig& config,
    const std::vector<std::string>& subdirs) -> Result<std::vector<Question>> {
  fs::path root = fs::absolute(config.root_dir).lexically_normal();
  std::vector<Question> questions;

  if (!subdirs.empty()) {
    spdlog::debug("limiting tests to subdirectories: {}", subdirs.size());
    for (const auto& subdir : subdirs) {
      fs::path dir = fs::path(subdir).is_absolute() ? fs::path(subdir)
                                                    : root / subdir;
      if (!fs::exists(dir / kMainSource)) {
        return std::unexpected(
            Diagnostic::Error(
                std::format("no {} in {}", kMainSource, dir.string())));
      }
      questions.push_back(MakeQuestion(root, dir));
    }
  } else {
    fs::path build_dir = fs::absolute(config.BuildDir()).lexically_normal();
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (it->is_directory()) {
        if (it->path().lexically_normal() == build_dir) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (it->path().filename() != kMainSource) {
        continue;
      }
      fs::path dir = it->path().parent_path();
      if (fs::exists(dir / kNoCheckMarker)) {
        spdlog::info(
            "skipping {} because of {} file", dir.filename().string(),
            kNoCheckMarker);
        continue;
      }
      questions.push_back(MakeQuestion(root, dir));
    }
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "failed to scan {}: {}", root.string(), ec.message())));
    }
  }

  std::ranges::sort(questions, {}, &Question::relative_dir);
  return questions;
}

auto ResolveExecutable(
    const config::ProjectConfig& config, const Question& question)
    -> fs::path {
  fs::path primary = config.BuildDir() / question.relative_dir / question.name;
  if (fs::is_regular_file(primary)) {
    return primary;
  }
  fs::path fallback = question.dir / kFallbackBuildDir / question.name;
  if (fs::is_regular_file(fallback)) {
    return fallback;
  }
  return primary;
}

}  // namespace hwsuite::driver
