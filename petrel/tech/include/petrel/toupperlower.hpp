#pragma once

#include <cstddef>

namespace petrel {

// ASCII only, independent of the C locale.
constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch; }

// Lower-cases the 'len' bytes starting at 'buf' in place.
constexpr void tolower(char* buf, std::size_t len) noexcept {
  for (std::size_t pos = 0; pos < len; ++pos) {
    buf[pos] = tolower(buf[pos]);
  }
}

}  // namespace petrel
