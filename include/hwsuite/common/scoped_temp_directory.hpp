#pragma once

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <utility>

namespace hwsuite::common {

// RAII guard for temp directory cleanup (unless HWSUITE_KEEP_TMP is set)
class ScopedTempDirectory {
 public:
  explicit ScopedTempDirectory(std::filesystem::path path)
      : path_(std::move(path)) {
  }

  ScopedTempDirectory(const ScopedTempDirectory&) = delete;
  auto operator=(const ScopedTempDirectory&) -> ScopedTempDirectory& = delete;

  ScopedTempDirectory(ScopedTempDirectory&& other) noexcept
      : path_(std::exchange(other.path_, {})) {
  }
  auto operator=(ScopedTempDirectory&& other) noexcept
      -> ScopedTempDirectory& {
    if (this != &other) {
      Cleanup();
      path_ = std::exchange(other.path_, {});
    }
    return *this;
  }

  ~ScopedTempDirectory() noexcept {
    Cleanup();
  }

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  void Cleanup() noexcept {
    if (std::getenv("HWSUITE_KEEP_TMP") != nullptr) {
      return;
    }
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  std::filesystem::path path_;
};

// Generate unique temp directory path using pid and an atomic counter
inline auto MakeUniqueTempPath(const std::string& prefix)
    -> std::filesystem::path {
  static std::atomic<uint64_t> counter{0};
  auto unique_suffix = std::to_string(getpid()) + "_" +
                       std::to_string(counter.fetch_add(1));
  return std::filesystem::temp_directory_path() / "hwsuite" /
         (prefix + "_" + unique_suffix);
}

// Create a fresh, empty directory owned by the returned guard.
inline auto CreateScopedTempDirectory(const std::string& prefix)
    -> ScopedTempDirectory {
  auto path = MakeUniqueTempPath(prefix);
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  return ScopedTempDirectory(path);
}

}  // namespace hwsuite::common
