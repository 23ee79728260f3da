#include <petrel/petrel.hpp>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

void PrintUsage(std::string_view progName) {
  std::cerr << "Usage: " << progName << " [--directory <dir>] [--port <port>] [--log-level <level>] [--version]\n"
            << "  --directory <dir>    base directory of /files/<name> (default: current directory)\n"
            << "  --port <port>        TCP port to listen on, 0 for an ephemeral one (default: "
            << petrel::HttpServerConfig::kDefaultPort << ")\n"
            << "  --log-level <level>  trace, debug, info, warn, error, critical or off (default: info)\n"
            << "  --version            print version information and exit\n"
            << "  --help               print this help and exit\n";
}

std::optional<uint16_t> ParsePort(std::string_view str) {
  uint16_t port = 0;
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), port);
  if (errc != std::errc{} || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return port;
}

// Accepts both '--name' and '-name' spellings.
bool IsOption(std::string_view arg, std::string_view name) {
  if (arg.starts_with("--")) {
    arg.remove_prefix(2);
  } else if (arg.starts_with('-')) {
    arg.remove_prefix(1);
  } else {
    return false;
  }
  return arg == name;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string_view progName = argc > 0 ? argv[0] : "petrel-server";

  petrel::HttpServerConfig config;
  spdlog::level::level_enum logLevel = spdlog::level::info;

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (IsOption(arg, "help") || IsOption(arg, "h")) {
      PrintUsage(progName);
      return EXIT_SUCCESS;
    }
    if (IsOption(arg, "version")) {
      std::cout << petrel::fullVersion() << '\n';
      return EXIT_SUCCESS;
    }
    const bool expectsValue = IsOption(arg, "directory") || IsOption(arg, "port") || IsOption(arg, "log-level");
    if (!expectsValue) {
      std::cerr << "Unknown argument '" << arg << "'\n";
      PrintUsage(progName);
      return EXIT_FAILURE;
    }
    if (argPos + 1 >= argc) {
      std::cerr << "Missing value for '" << arg << "'\n";
      PrintUsage(progName);
      return EXIT_FAILURE;
    }
    const std::string_view value(argv[++argPos]);
    if (IsOption(arg, "directory")) {
      config.withDirectory(value);
    } else if (IsOption(arg, "port")) {
      const auto port = ParsePort(value);
      if (!port) {
        std::cerr << "Invalid port '" << value << "'\n";
        PrintUsage(progName);
        return EXIT_FAILURE;
      }
      config.withPort(*port);
    } else {
      logLevel = spdlog::level::from_str(std::string(value));
      if (logLevel == spdlog::level::off && value != "off") {
        std::cerr << "Invalid log level '" << value << "'\n";
        PrintUsage(progName);
        return EXIT_FAILURE;
      }
    }
  }

  petrel::log::set_level(logLevel);
  petrel::log::info("Starting {}", petrel::fullVersion());

  petrel::SignalHandler::Enable();

  try {
    petrel::HttpServer server(std::move(config));
    server.run();
  } catch (const std::exception& ex) {
    petrel::log::critical("Fatal error: {}", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
