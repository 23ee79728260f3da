#pragma once

#include <string>
#include <string_view>

namespace petrel {

constexpr bool IsAsciiSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
}

// Trim any ASCII whitespace, including CR and LF.
constexpr std::string_view TrimSpace(std::string_view sv) noexcept {
  while (!sv.empty() && IsAsciiSpace(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsAsciiSpace(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Copy of 'sv' with every ASCII whitespace character removed.
inline std::string RemoveSpaces(std::string_view sv) {
  std::string ret;
  ret.reserve(sv.size());
  for (char ch : sv) {
    if (!IsAsciiSpace(ch)) {
      ret.push_back(ch);
    }
  }
  return ret;
}

}  // namespace petrel
