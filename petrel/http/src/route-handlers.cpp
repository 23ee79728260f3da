#include "petrel/route-handlers.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "petrel/file.hpp"
#include "petrel/http-constants.hpp"
#include "petrel/http-response.hpp"
#include "petrel/http-status-code.hpp"
#include "petrel/log.hpp"

namespace petrel {

HttpResponse UserAgentResponse(std::string_view userAgent) {
  HttpResponse resp(http::StatusCodeOK);
  resp.header(http::ContentType, http::ContentTypeTextPlain);
  resp.header(http::ContentLength, userAgent.size());
  resp.body(std::string(userAgent));
  return resp;
}

std::filesystem::path FileRouteHandler::resolve(std::string_view name) const {
  // joined, not replaced: a leading '/' in name does not escape the base directory prefix
  while (name.starts_with('/')) {
    name.remove_prefix(1);
  }
  return (_baseDirectory / std::filesystem::path(name)).lexically_normal();
}

HttpResponse FileRouteHandler::get(std::string_view name) const {
  const auto filePath = resolve(name);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(filePath, ec)) {
    log::debug("File '{}' does not exist or is not a regular file", filePath.string());
    return HttpResponse(http::StatusCodeNotFound);
  }

  File file(filePath.string());
  if (!file) {
    return HttpResponse(http::StatusCodeNotFound);
  }

  std::string content;
  try {
    content = file.loadAllContent();
  } catch (const std::runtime_error& ex) {
    log::error("Unable to read file '{}': {}", filePath.string(), ex.what());
    return HttpResponse(http::StatusCodeNotFound);
  }

  log::debug("Serving file '{}' ({} bytes)", filePath.string(), content.size());

  HttpResponse resp(http::StatusCodeOK);
  resp.header(http::ContentType, http::ContentTypeApplicationOctetStream);
  resp.header(http::ContentLength, content.size());
  resp.body(std::move(content));
  return resp;
}

HttpResponse FileRouteHandler::post(std::string_view name, std::string_view body) const {
  const auto filePath = resolve(name);

  File file(filePath.string(), File::OpenMode::WriteTruncate);
  if (!file) {
    return HttpResponse(http::StatusCodeBadRequest);
  }
  if (!file.writeAll(body)) {
    return HttpResponse(http::StatusCodeBadRequest);
  }

  log::info("Created file '{}' ({} bytes)", filePath.string(), body.size());
  return HttpResponse(http::StatusCodeCreated);
}

}  // namespace petrel
