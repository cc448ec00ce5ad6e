#include "hwsuite/common/file_io.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::common {

auto ReadFileText(const std::filesystem::path& path) -> Result<std::string> {
  auto text = ReadFileTextIfExists(path);
  if (!text) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot read file '{}'", path.string())));
  }
  return *std::move(text);
}

auto ReadFileTextIfExists(const std::filesystem::path& path)
    -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

auto SplitLines(const std::string& text, bool strip_newline)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t newline = text.find('\n', start);
    if (newline == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    size_t end = strip_newline ? newline : newline + 1;
    lines.push_back(text.substr(start, end - start));
    start = newline + 1;
  }
  return lines;
}

auto ReadFileLines(const std::filesystem::path& path, bool strip_newline)
    -> Result<std::vector<std::string>> {
  auto text = ReadFileText(path);
  if (!text) {
    return std::unexpected(text.error());
  }
  return SplitLines(*text, strip_newline);
}

auto WriteFileText(const std::filesystem::path& path, const std::string& text)
    -> Result<void> {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
  if (!out.good()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("failed to write file '{}'", path.string())));
  }
  return {};
}

}  // namespace hwsuite::common
