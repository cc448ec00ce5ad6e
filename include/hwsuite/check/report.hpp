#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/check/outcome.hpp"
#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::check {

enum class ReportFormat : uint8_t {
  kDiff,  // Unified line diff
  kFull,  // Delimited full dumps
  kRepr,  // Escaped literals
  kNone,
};

auto ParseReportFormat(std::string_view text) -> Result<ReportFormat>;
auto ToString(ReportFormat format) -> std::string_view;

inline constexpr std::size_t kDiffContextLines = 3;

// Unified diff of two texts split on '\n'. Empty if they are equal.
auto UnifiedDiff(
    std::string_view expected, std::string_view actual,
    std::size_t context = kDiffContextLines) -> std::vector<std::string>;

// One headline per failure, "<question>: <case>: <message>", followed by
// details for output mismatches.
void WriteReport(
    std::ostream& out, const std::vector<Outcome>& failures,
    ReportFormat format);

}  // namespace hwsuite::check
