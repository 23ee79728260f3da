#include "petrel/version.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/version.h>
#include <zlib.h>

#include <string>

namespace petrel {

std::string fullVersion() {
  return fmt::format("petrel {}\n  compression: zlib {}\n  logging: spdlog {}.{}.{}", version(), zlibVersion(),
                     SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
}

}  // namespace petrel
