#include "hwsuite/check/report.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/check/outcome.hpp"
#include "hwsuite/common/diagnostic.hpp"
#include "hwsuite/common/repr.hpp"

namespace hwsuite::check {

namespace {

constexpr std::string_view kRule =
    "=================================================";

auto SplitOnNewline(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (true) {
    std::size_t newline = text.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.push_back(text.substr(start));
      return lines;
    }
    lines.push_back(text.substr(start, newline - start));
    start = newline + 1;
  }
}

enum class EditOp : uint8_t { kKeep, kDelete, kInsert };

struct Edit {
  EditOp op;
  std::size_t a;  // Index into expected
  std::size_t b;  // Index into actual
};

// Shortest edit script from the LCS table.
auto ComputeEdits(
    const std::vector<std::string_view>& a,
    const std::vector<std::string_view>& b) -> std::vector<Edit> {
  std::size_t n = a.size();
  std::size_t m = b.size();
  std::vector<std::vector<std::size_t>> lcs(
      n + 1, std::vector<std::size_t>(m + 1, 0));
  for (std::size_t i = n; i-- > 0;) {
    for (std::size_t j = m; j-- > 0;) {
      lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1
                               : std::max(lcs[i + 1][j], lcs[i][j + 1]);
    }
  }
  std::vector<Edit> edits;
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < n || j < m) {
    if (i < n && j < m && a[i] == b[j]) {
      edits.push_back({EditOp::kKeep, i++, j++});
    } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
      edits.push_back({EditOp::kDelete, i++, j});
    } else {
      edits.push_back({EditOp::kInsert, i, j++});
    }
  }
  return edits;
}

auto HunkRange(std::size_t start, std::size_t count) -> std::string {
  // Unified diff numbers lines from 1; an empty range names the line before.
  if (count == 0) {
    return std::format("{},0", start);
  }
  if (count == 1) {
    return std::format("{}", start + 1);
  }
  return std::format("{},{}", start + 1, count);
}

void WriteDetails(std::ostream& out, const Outcome& outcome, ReportFormat f) {
  std::string_view expected = outcome.expected_text.value_or("");
  std::string_view actual = outcome.actual_text.value_or("");
  switch (f) {
    case ReportFormat::kDiff:
      for (const auto& line : UnifiedDiff(expected, actual)) {
        out << line << '\n';
      }
      break;
    case ReportFormat::kFull:
      out << kRule << "\nEXPECTED\n" << kRule << '\n' << expected;
      out << kRule << '\n' << kRule << "\nACTUAL\n" << kRule << '\n';
      out << actual << kRule << '\n';
      break;
    case ReportFormat::kRepr:
      out << "expected: " << common::Repr(expected) << '\n';
      out << "  actual: " << common::Repr(actual) << '\n';
      break;
    case ReportFormat::kNone:
      break;
  }
}

}  // namespace

auto ParseReportFormat(std::string_view text) -> Result<ReportFormat> {
  for (auto format : {ReportFormat::kDiff, ReportFormat::kFull,
                      ReportFormat::kRepr, ReportFormat::kNone}) {
    if (text == ToString(format)) {
      return format;
    }
  }
  return std::unexpected(
      Diagnostic::Error(std::format("invalid report format '{}'", text))
          .WithNote("expected one of: diff, full, repr, none"));
}

auto ToString(ReportFormat format) -> std::string_view {
  switch (format) {
    case ReportFormat::kDiff:
      return "diff";
    case ReportFormat::kFull:
      return "full";
    case ReportFormat::kRepr:
      return "repr";
    case ReportFormat::kNone:
      return "none";
  }
  return "unknown";
}

auto UnifiedDiff(
    std::string_view expected, std::string_view actual, std::size_t context)
    -> std::vector<std::string> {
  auto a = SplitOnNewline(expected);
  auto b = SplitOnNewline(actual);
  auto edits = ComputeEdits(a, b);
  std::vector<std::string> out;
  if (std::ranges::all_of(
          edits, [](const Edit& e) { return e.op == EditOp::kKeep; })) {
    return out;
  }
  out.emplace_back("--- expected");
  out.emplace_back("+++ actual");

  std::size_t k = 0;
  while (k < edits.size()) {
    // Find the next change and grow a hunk around it.
    while (k < edits.size() && edits[k].op == EditOp::kKeep) {
      ++k;
    }
    if (k == edits.size()) {
      break;
    }
    std::size_t begin = k >= context ? k - context : 0;
    std::size_t end = k;
    std::size_t keep_run = 0;
    while (end < edits.size()) {
      if (edits[end].op == EditOp::kKeep) {
        if (++keep_run > 2 * context) {
          --keep_run;
          break;
        }
      } else {
        keep_run = 0;
      }
      ++end;
    }
    // Trim trailing context to `context` lines.
    std::size_t trailing = std::min(keep_run, context);
    end = end - keep_run + trailing;

    std::size_t a_start = edits[begin].a;
    std::size_t b_start = edits[begin].b;
    std::size_t a_count = 0;
    std::size_t b_count = 0;
    for (std::size_t x = begin; x < end; ++x) {
      a_count += edits[x].op != EditOp::kInsert ? 1 : 0;
      b_count += edits[x].op != EditOp::kDelete ? 1 : 0;
    }
    out.push_back(
        std::format(
            "@@ -{} +{} @@", HunkRange(a_start, a_count),
            HunkRange(b_start, b_count)));
    for (std::size_t x = begin; x < end; ++x) {
      const Edit& e = edits[x];
      switch (e.op) {
        case EditOp::kKeep:
          out.push_back(std::format(" {}", a[e.a]));
          break;
        case EditOp::kDelete:
          out.push_back(std::format("-{}", a[e.a]));
          break;
        case EditOp::kInsert:
          out.push_back(std::format("+{}", b[e.b]));
          break;
      }
    }
    k = end;
  }
  return out;
}

void WriteReport(
    std::ostream& out, const std::vector<Outcome>& failures,
    ReportFormat format) {
  for (const auto& outcome : failures) {
    std::string question = outcome.executable.filename().string();
    out << question << ": " << outcome.fixture.DisplayName() << ": "
        << outcome.message << '\n';
    if (outcome.classification == Classification::kDiff) {
      WriteDetails(out, outcome, format);
    }
  }
}

}  // namespace hwsuite::check
