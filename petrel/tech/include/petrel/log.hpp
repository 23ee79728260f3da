#pragma once

// Logging abstraction: all of petrel logs through spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace petrel {

namespace log = spdlog;

}  // namespace petrel
