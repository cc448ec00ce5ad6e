#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hwsuite/common/scoped_temp_directory.hpp"
#include "hwsuite/config/project_config.hpp"
#include "src/hwsuite/driver/questions.hpp"
#include "tests/common/test_files.hpp"

namespace hwsuite::driver {
namespace {

namespace fs = std::filesystem;
using test::WriteTextFile;

class QuestionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.emplace(common::CreateScopedTempDirectory("questions_test"));
    config_ = config::DefaultConfig(Dir());
  }

  [[nodiscard]] auto Dir() const -> const fs::path& {
    return dir_->Path();
  }

  void AddQuestion(const fs::path& relative) const {
    WriteTextFile(Dir() / relative / "main.cpp", "int main() {}\n");
  }

  [[nodiscard]] auto RelativeDirs(const std::vector<Question>& questions)
      const -> std::vector<std::string> {
    std::vector<std::string> dirs;
    for (const auto& q : questions) {
      dirs.push_back(q.relative_dir.string());
    }
    return dirs;
  }

  config::ProjectConfig config_;

 private:
  std::optional<common::ScopedTempDirectory> dir_;
};

TEST_F(QuestionsTest, FindsNestedQuestionsSorted) {
  AddQuestion("hw2/q1");
  AddQuestion("hw1/q2");
  AddQuestion("hw1/q1");
  auto questions = FindQuestions(config_, {});
  ASSERT_TRUE(questions.has_value());
  EXPECT_EQ(
      RelativeDirs(*questions),
      (std::vector<std::string>{"hw1/q1", "hw1/q2", "hw2/q1"}));
  EXPECT_EQ((*questions)[0].name, "q1");
}

TEST_F(QuestionsTest, SkipsNoCheckAndBuildDirectories) {
  AddQuestion("q1");
  AddQuestion("q2");
  WriteTextFile(Dir() / "q2" / ".nocheck", "");
  AddQuestion("cmake-build-debug/_deps/thing");
  auto questions = FindQuestions(config_, {});
  ASSERT_TRUE(questions.has_value());
  EXPECT_EQ(RelativeDirs(*questions), (std::vector<std::string>{"q1"}));
}

TEST_F(QuestionsTest, ExplicitSubdirsRestrictTheSet) {
  AddQuestion("q1");
  AddQuestion("q2");
  auto questions = FindQuestions(config_, {"q2"});
  ASSERT_TRUE(questions.has_value());
  EXPECT_EQ(RelativeDirs(*questions), (std::vector<std::string>{"q2"}));
}

TEST_F(QuestionsTest, SubdirWithoutMainIsError) {
  fs::create_directories(Dir() / "empty");
  auto questions = FindQuestions(config_, {"empty"});
  ASSERT_FALSE(questions.has_value());
  EXPECT_TRUE(questions.error().IsError());
}

TEST_F(QuestionsTest, ExecutablePrefersBuildTree) {
  AddQuestion("hw1/q1");
  Question q{
      .name = "q1",
      .dir = Dir() / "hw1" / "q1",
      .relative_dir = fs::path("hw1") / "q1",
  };
  fs::path primary = config_.BuildDir() / "hw1" / "q1" / "q1";
  fs::path fallback = q.dir / "cmake-build" / "q1";

  EXPECT_EQ(ResolveExecutable(config_, q).string(), primary.string());
  WriteTextFile(fallback, "");
  EXPECT_EQ(ResolveExecutable(config_, q).string(), fallback.string());
  WriteTextFile(primary, "");
  EXPECT_EQ(ResolveExecutable(config_, q).string(), primary.string());
}

}  // namespace
}  // namespace hwsuite::driver
