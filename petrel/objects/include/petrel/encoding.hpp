#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "petrel/http-constants.hpp"

namespace petrel {

enum class Encoding : std::uint8_t {
  gzip,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {http::gzip, http::identity};
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

}  // namespace petrel
