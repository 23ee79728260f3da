#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "petrel/toupperlower.hpp"

namespace petrel {

// HTTP header names compare ASCII case-insensitively.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return lhs.size() == rhs.size() &&
         std::ranges::equal(lhs, rhs, [](char lhsCh, char rhsCh) { return tolower(lhsCh) == tolower(rhsCh); });
}

// 64-bit FNV-1a of the lower-cased bytes: names differing only by case hash the same.
struct CaseInsensitiveHashFunc {
  constexpr std::size_t operator()(std::string_view str) const noexcept {
    uint64_t hash = 14695981039346656037ULL;
    for (char ch : str) {
      hash ^= static_cast<unsigned char>(tolower(ch));
      hash *= 1099511628211ULL;
    }
    return static_cast<std::size_t>(hash);
  }
};

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace petrel
