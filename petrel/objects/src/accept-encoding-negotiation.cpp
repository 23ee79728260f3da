#include "petrel/accept-encoding-negotiation.hpp"

#include <ranges>
#include <string>
#include <string_view>

#include "petrel/encoding.hpp"
#include "petrel/string-trim.hpp"

namespace petrel {

Encoding EncodingSelector::negotiateAcceptEncoding(std::string_view acceptEncoding) {
  if (acceptEncoding.empty()) {
    return Encoding::none;
  }

  const std::string compacted = RemoveSpaces(acceptEncoding);
  for (auto part : compacted | std::views::split(',')) {
    const std::string_view token(part.begin(), part.end());
    if (token == GetEncodingStr(Encoding::gzip)) {
      return Encoding::gzip;
    }
  }
  return Encoding::none;
}

}  // namespace petrel
