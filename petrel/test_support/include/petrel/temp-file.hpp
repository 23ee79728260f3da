#pragma once

#include <filesystem>
#include <string_view>

namespace petrel::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  // Create a uniquely-named temporary directory with optional prefix.
  explicit ScopedTempDir(std::string_view prefix = "petrel-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace petrel::test
