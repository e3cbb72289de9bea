#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace devserve::http {

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    std::vector<Header> headers;

    // Case-insensitive lookup; first match wins.
    std::optional<std::string> header(const std::string &name) const;
    std::string requestLine() const;
};

struct HttpResponse {
    int status = 200;
    std::vector<Header> headers;
    std::string body;
    // HEAD answers keep Content-Length of the full body but send none.
    bool omitBody = false;

    void setHeader(const std::string &name, const std::string &value);
    std::optional<std::string> header(const std::string &name) const;
    bool hasHeader(const std::string &name) const;

    // Status line, headers and (unless omitBody) the body, ready for the socket.
    std::string serialize() const;
};

// Parses the request line and header fields of a complete request head
// (everything up to and including the blank line).
bool parseRequestHead(const std::string &head, HttpRequest &out, std::string &err);

std::string statusText(int code);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string formatHttpDate(std::chrono::system_clock::time_point when);
std::optional<std::chrono::system_clock::time_point> parseHttpDate(const std::string &text);

// Small HTML error page in the usual "Error response" shape.
HttpResponse makeErrorResponse(int status, const std::string &message);

std::string toLower(std::string value);
std::string htmlEscape(const std::string &s);

} // namespace devserve::http
