#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "http/http_message.hpp"

namespace devserve::http {

using HttpHandler = std::function<HttpResponse(const HttpRequest &)>;

// GET/HEAD file serving under root: directory redirect, index files,
// directory listing, 404/403, Last-Modified and If-Modified-Since.
HttpHandler makeStaticFileHandler(const std::filesystem::path &root, const std::string &indexFile = "index.html");

void addCorsHeaders(HttpResponse &resp);

// Adds the permissive Access-Control-Allow-* headers to every response.
HttpHandler withCorsHeaders(HttpHandler next);

// Adds Cache-Control: no-cache when the request target ends in .js or .css.
HttpHandler withNoCacheForAssets(HttpHandler next);

// Answers OPTIONS with an empty 200 without calling next.
HttpHandler withPreflight(HttpHandler next);

// Static files behind the preflight, CORS and asset cache decorators.
HttpHandler makeDevServerHandler(const std::filesystem::path &root, const std::string &indexFile = "index.html");

// Test-friendly helpers for the path validation logic
std::string urlDecode(const std::string &raw);
std::string urlEncodePath(const std::string &raw);
bool sanitizeRequestPath(const std::string &rawPath, std::filesystem::path &relativeOut);
bool isPathSafe(const std::filesystem::path &filePath, const std::filesystem::path &serveRoot);

} // namespace devserve::http
