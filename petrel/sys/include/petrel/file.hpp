#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "petrel/base-fd.hpp"

namespace petrel {

class File {
 public:
  enum class OpenMode : uint8_t { ReadOnly, WriteTruncate };

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. WriteTruncate creates the file if needed (mode 0644) and truncates it.
  // On failure, the error is logged and operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  // Open a file by path (must be null-terminated).
  // On failure, the error is logged and operator bool() returns false.
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the current file size in bytes.
  // Throws std::runtime_error if the file is not opened or cannot be stat'ed.
  [[nodiscard]] std::size_t size() const;

  // Read the whole file content from the current offset.
  // Throws std::runtime_error on read error (for instance when the path is a directory).
  [[nodiscard]] std::string loadAllContent() const;

  // Write all of 'data' at the current offset.
  // Returns false on error (logged).
  [[nodiscard]] bool writeAll(std::string_view data) const;

 private:
  BaseFd _fd;
};

}  // namespace petrel
