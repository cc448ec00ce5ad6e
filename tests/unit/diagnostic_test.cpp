#include <gtest/gtest.h>

#include <string>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite {
namespace {

TEST(DiagnosticTest, ExceptionMessageWithoutNotes) {
  DiagnosticException e(Diagnostic::HostError("cannot read input.txt"));
  EXPECT_EQ(std::string(e.what()), "cannot read input.txt");
}

TEST(DiagnosticTest, ExceptionMessageCarriesNotes) {
  DiagnosticException e(
      Diagnostic::Error("bad fixture name")
          .WithNote("in q1/test-cases")
          .WithNote("expected <name>-expected-output.txt"));
  EXPECT_EQ(
      std::string(e.what()),
      "bad fixture name (in q1/test-cases; "
      "expected <name>-expected-output.txt)");
  EXPECT_EQ(e.GetDiagnostic().primary.message, "bad fixture name");
  EXPECT_EQ(e.GetDiagnostic().notes.size(), 2U);
}

TEST(DiagnosticTest, ErrorKinds) {
  EXPECT_TRUE(Diagnostic::Error("x").IsError());
  EXPECT_TRUE(Diagnostic::HostError("x").IsError());
  EXPECT_FALSE(Diagnostic::Warning("x").IsError());
}

}  // namespace
}  // namespace hwsuite
