#pragma once

#include <string>
#include <string_view>

#ifndef PETREL_VERSION_STR
#error "PETREL_VERSION_STR must be defined via build system"
#endif

namespace petrel {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return PETREL_VERSION_STR; }

// Multiline description of the project version and of the libraries it runs with:
//   petrel <version>
//     compression: zlib <version>
//     logging: spdlog <major>.<minor>.<patch>
std::string fullVersion();

}  // namespace petrel
