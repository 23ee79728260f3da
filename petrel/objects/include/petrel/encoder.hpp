#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// =============================================================================
// petrel Encoding Abstraction
// =============================================================================
// Encoder: configuration-only object providing one-shot compression of a full buffer.
// Implementations must be usable concurrently from several connection threads, which
// is why they keep no mutable state between calls.
//
// Error Handling: Implementations throw on initialization or fatal internal codec errors.
// Callers decide whether a failure is fatal (see ContentNegotiator for the best-effort policy).
// =============================================================================

namespace petrel {

class Encoder {
 public:
  virtual ~Encoder() = default;

  // One-shot full-buffer compression. Compressed data is appended to 'buf'.
  // 'extraCapacity': additional capacity to ensure in 'buf' before encoding (to avoid multiple reallocations).
  virtual void encodeFull(std::size_t extraCapacity, std::string_view data, std::string &buf) const = 0;
};

}  // namespace petrel
