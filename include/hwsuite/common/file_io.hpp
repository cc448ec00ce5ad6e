#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::common {

// Read a whole file as text.
auto ReadFileText(const std::filesystem::path& path) -> Result<std::string>;

// Read a whole file, or nullopt if it cannot be opened.
auto ReadFileTextIfExists(const std::filesystem::path& path)
    -> std::optional<std::string>;

// Split into lines. Each line keeps its trailing '\n' unless strip_newline;
// a final line without '\n' is returned as-is.
auto SplitLines(const std::string& text, bool strip_newline)
    -> std::vector<std::string>;

auto ReadFileLines(const std::filesystem::path& path, bool strip_newline)
    -> Result<std::vector<std::string>>;

auto WriteFileText(const std::filesystem::path& path, const std::string& text)
    -> Result<void>;

}  // namespace hwsuite::common
