#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "http/http_message.hpp"

using devserve::http::HttpRequest;
using devserve::http::HttpResponse;

TEST(HttpRequestParse, ParsesRequestLineAndHeaders)
{
    HttpRequest req;
    std::string err;
    ASSERT_TRUE(devserve::http::parseRequestHead(
        "GET /index.html?x=1 HTTP/1.1\r\nHost: localhost:8000\r\nIf-Modified-Since:  Sun, 06 Nov 1994 08:49:37 GMT \r\n\r\n",
        req, err)) << err;

    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.target, "/index.html?x=1");
    EXPECT_EQ(req.version, "HTTP/1.1");
    ASSERT_EQ(req.headers.size(), 2u);
    EXPECT_EQ(req.header("host").value_or(""), "localhost:8000");
    EXPECT_EQ(req.header("IF-MODIFIED-SINCE").value_or(""), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_FALSE(req.header("Accept").has_value());
    EXPECT_EQ(req.requestLine(), "GET /index.html?x=1 HTTP/1.1");
}

TEST(HttpRequestParse, RejectsMissingVersion)
{
    HttpRequest req;
    std::string err;
    EXPECT_FALSE(devserve::http::parseRequestHead("GET /\r\n\r\n", req, err));
    EXPECT_NE(err.find("Bad request syntax"), std::string::npos);
}

TEST(HttpRequestParse, RejectsUnknownProtocol)
{
    HttpRequest req;
    std::string err;
    EXPECT_FALSE(devserve::http::parseRequestHead("GET / SPDY/3\r\n\r\n", req, err));
    EXPECT_NE(err.find("Bad request version"), std::string::npos);
}

TEST(HttpRequestParse, RejectsHeadWithoutLineBreak)
{
    HttpRequest req;
    std::string err;
    EXPECT_FALSE(devserve::http::parseRequestHead("garbage", req, err));
}

TEST(HttpResponseSerialize, WritesStatusLineHeadersAndBody)
{
    HttpResponse resp;
    resp.status = 404;
    resp.setHeader("Content-Type", "text/plain");
    resp.setHeader("Content-Length", "9");
    resp.body = "not found";

    EXPECT_EQ(resp.serialize(), "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 9\r\n\r\nnot found");
}

TEST(HttpResponseSerialize, OmitsBodyForHeadAndNotModified)
{
    HttpResponse head;
    head.body = "hello";
    head.omitBody = true;
    EXPECT_EQ(head.serialize(), "HTTP/1.1 200 OK\r\n\r\n");

    HttpResponse notModified;
    notModified.status = 304;
    notModified.body = "ignored";
    EXPECT_EQ(notModified.serialize(), "HTTP/1.1 304 Not Modified\r\n\r\n");
}

TEST(HttpResponseHeaders, SetHeaderReplacesCaseInsensitively)
{
    HttpResponse resp;
    resp.setHeader("Cache-Control", "max-age=60");
    resp.setHeader("cache-control", "no-cache");

    ASSERT_EQ(resp.headers.size(), 1u);
    EXPECT_EQ(resp.header("Cache-Control").value_or(""), "no-cache");
    EXPECT_TRUE(resp.hasHeader("CACHE-CONTROL"));
}

TEST(HttpStatus, KnownAndUnknownTexts)
{
    EXPECT_EQ(devserve::http::statusText(200), "OK");
    EXPECT_EQ(devserve::http::statusText(301), "Moved Permanently");
    EXPECT_EQ(devserve::http::statusText(501), "Not Implemented");
    EXPECT_EQ(devserve::http::statusText(799), "Error");
}

TEST(HttpDate, FormatsImfFixdate)
{
    const auto when = std::chrono::system_clock::from_time_t(784111777);
    EXPECT_EQ(devserve::http::formatHttpDate(when), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(HttpDate, ParsesImfFixdate)
{
    const auto parsed = devserve::http::parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed), 784111777);
    EXPECT_FALSE(devserve::http::parseHttpDate("yesterday").has_value());
}

TEST(HttpErrorPage, CarriesStatusMessageAndLength)
{
    const HttpResponse resp = devserve::http::makeErrorResponse(404, "File not found");

    EXPECT_EQ(resp.status, 404);
    EXPECT_NE(resp.body.find("Error code: 404"), std::string::npos);
    EXPECT_NE(resp.body.find("Message: File not found."), std::string::npos);
    EXPECT_EQ(resp.header("Content-Length").value_or(""), std::to_string(resp.body.size()));
    EXPECT_EQ(resp.header("Content-Type").value_or(""), "text/html;charset=utf-8");
}

TEST(HttpErrorPage, EscapesMessage)
{
    const HttpResponse resp = devserve::http::makeErrorResponse(501, "Unsupported method ('<X>')");
    EXPECT_NE(resp.body.find("&lt;X&gt;"), std::string::npos);
}
