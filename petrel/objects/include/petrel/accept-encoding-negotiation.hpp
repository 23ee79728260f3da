#pragma once

#include <string_view>

#include "petrel/encoding.hpp"

namespace petrel {

class EncodingSelector {
 public:
  // Select the response encoding from a raw Accept-Encoding header value.
  // Rules implemented:
  //  - Every whitespace character is removed, then the value is split on commas.
  //  - gzip is selected if and only if one of the tokens is exactly "gzip" (case-sensitive).
  //  - Quality values, 'identity' and '*' are not interpreted: "gzip;q=0" is not the "gzip" token.
  // Returns Encoding::none when no supported encoding is accepted (including an empty header).
  [[nodiscard]] static Encoding negotiateAcceptEncoding(std::string_view acceptEncoding);
};

}  // namespace petrel
