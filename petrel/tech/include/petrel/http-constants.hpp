#pragma once

#include <string_view>

namespace petrel::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Request header names are
// lower-cased by the parser, so lookups are done case-insensitively.

// Version
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view POST = "POST";

// Standard Header Field Names (as they typically appear in canonical form)
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view Allow = "Allow";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Compression
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";

}  // namespace petrel::http
