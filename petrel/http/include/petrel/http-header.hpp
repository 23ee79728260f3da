#pragma once

#include <string>
#include <string_view>

namespace petrel::http {

// Owned header, as stored in responses.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// Non-owning header, pointing into a request buffer.
struct HeaderView {
  std::string_view name;
  std::string_view value;

  bool operator==(const HeaderView&) const noexcept = default;
};

}  // namespace petrel::http
