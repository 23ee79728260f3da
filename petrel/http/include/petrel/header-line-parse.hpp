#pragma once

#include <string_view>

#include "petrel/http-header.hpp"
#include "petrel/string-trim.hpp"

namespace petrel::http {

// Parse a single HTTP header line, already stripped from its line terminator.
// The line is split on its first ':' and both sides are trimmed of ASCII whitespace.
// Returns an empty name view on failure (no colon, or nothing before it).
constexpr HeaderView ParseHeaderLine(std::string_view line) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    // malformed: no colon
    return {};
  }
  return HeaderView{TrimSpace(line.substr(0, colonPos)), TrimSpace(line.substr(colonPos + 1))};
}

}  // namespace petrel::http
