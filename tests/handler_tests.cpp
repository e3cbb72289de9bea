#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "http/handlers.hpp"

namespace fs = std::filesystem;

using devserve::http::HttpRequest;
using devserve::http::HttpResponse;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("devserve_handler_test_" + name + "_" + std::to_string(now));
    }

    void writeFile(const fs::path &path, const std::string &content)
    {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        std::ofstream f(path, std::ios::binary);
        f << content;
    }

    HttpRequest request(const std::string &method, const std::string &target)
    {
        HttpRequest req;
        req.method = method;
        req.target = target;
        return req;
    }

    void expectCors(const HttpResponse &resp)
    {
        EXPECT_EQ(resp.header("Access-Control-Allow-Origin").value_or(""), "*");
        EXPECT_EQ(resp.header("Access-Control-Allow-Methods").value_or(""), "GET, POST, OPTIONS");
        EXPECT_EQ(resp.header("Access-Control-Allow-Headers").value_or(""), "Content-Type");
    }

    class StaticFilesTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            root_ = makeTempRoot(::testing::UnitTest::GetInstance()->current_test_info()->name());
            writeFile(root_ / "index.html", "<h1>notes</h1>");
            writeFile(root_ / "js" / "app.js", "console.log('hi');");
            writeFile(root_ / "css" / "style.css", "body{}");
            writeFile(root_ / "data" / "notes.json", "[]");
            writeFile(root_ / "docs" / "b.txt", "b");
            writeFile(root_ / "docs" / "A file.txt", "a");
            fs::create_directories(root_ / "docs" / "nested");
            handler_ = devserve::http::makeDevServerHandler(root_);
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        fs::path root_;
        devserve::http::HttpHandler handler_;
    };

} // namespace

TEST_F(StaticFilesTest, GetServesFileWithCorsAndContentType)
{
    const HttpResponse resp = handler_(request("GET", "/index.html"));

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "<h1>notes</h1>");
    EXPECT_EQ(resp.header("Content-Type").value_or(""), "text/html; charset=utf-8");
    EXPECT_EQ(resp.header("Content-Length").value_or(""), "14");
    EXPECT_TRUE(resp.hasHeader("Last-Modified"));
    expectCors(resp);
    EXPECT_FALSE(resp.hasHeader("Cache-Control"));
}

TEST_F(StaticFilesTest, RootServesIndexFile)
{
    const HttpResponse resp = handler_(request("GET", "/"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "<h1>notes</h1>");
}

TEST_F(StaticFilesTest, ScriptsAndStylesAreNotCached)
{
    const HttpResponse js = handler_(request("GET", "/js/app.js"));
    EXPECT_EQ(js.status, 200);
    EXPECT_EQ(js.header("Cache-Control").value_or(""), "no-cache");
    expectCors(js);

    const HttpResponse css = handler_(request("GET", "/css/style.css"));
    EXPECT_EQ(css.status, 200);
    EXPECT_EQ(css.header("Cache-Control").value_or(""), "no-cache");

    const HttpResponse json = handler_(request("GET", "/data/notes.json"));
    EXPECT_EQ(json.status, 200);
    EXPECT_FALSE(json.hasHeader("Cache-Control"));
}

TEST_F(StaticFilesTest, NoCacheFollowsRawTargetEvenWhenMissing)
{
    const HttpResponse missing = handler_(request("GET", "/js/missing.js"));
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.header("Cache-Control").value_or(""), "no-cache");

    const HttpResponse versioned = handler_(request("GET", "/js/app.js?v=2"));
    EXPECT_EQ(versioned.status, 200);
    EXPECT_FALSE(versioned.hasHeader("Cache-Control"));
}

TEST_F(StaticFilesTest, MissingFileIsNotFoundWithCors)
{
    const HttpResponse resp = handler_(request("GET", "/nope.html"));
    EXPECT_EQ(resp.status, 404);
    EXPECT_NE(resp.body.find("File not found"), std::string::npos);
    expectCors(resp);
}

TEST_F(StaticFilesTest, TraversalIsForbidden)
{
    const HttpResponse resp = handler_(request("GET", "/../etc/passwd"));
    EXPECT_EQ(resp.status, 403);
    expectCors(resp);

    const HttpResponse encoded = handler_(request("GET", "/%2e%2e/etc/passwd"));
    EXPECT_EQ(encoded.status, 403);
}

TEST_F(StaticFilesTest, DirectoryWithoutSlashRedirects)
{
    const HttpResponse resp = handler_(request("GET", "/docs?sort=name"));
    EXPECT_EQ(resp.status, 301);
    EXPECT_EQ(resp.header("Location").value_or(""), "/docs/?sort=name");
    expectCors(resp);
}

TEST_F(StaticFilesTest, DirectoryWithoutIndexIsListed)
{
    const HttpResponse resp = handler_(request("GET", "/docs/"));
    ASSERT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("Content-Type").value_or(""), "text/html; charset=utf-8");
    EXPECT_NE(resp.body.find("Directory listing for /docs/"), std::string::npos);
    EXPECT_NE(resp.body.find("<a href=\"A%20file.txt\">A file.txt</a>"), std::string::npos);
    EXPECT_NE(resp.body.find("<a href=\"nested/\">nested/</a>"), std::string::npos);

    // Case-insensitive order: "A file.txt", "b.txt", "nested/"
    const auto a = resp.body.find("A file.txt");
    const auto b = resp.body.find("b.txt");
    const auto nested = resp.body.find("nested/");
    EXPECT_LT(a, b);
    EXPECT_LT(b, nested);
}

TEST_F(StaticFilesTest, SymlinkedDirectoryIsMarkedWithAt)
{
    std::error_code ec;
    fs::create_directory_symlink(root_ / "docs" / "nested", root_ / "docs" / "shortcut", ec);
    if (ec)
    {
        GTEST_SKIP() << "symlinks not supported here";
    }

    const HttpResponse resp = handler_(request("GET", "/docs/"));
    ASSERT_EQ(resp.status, 200);
    EXPECT_NE(resp.body.find("<a href=\"shortcut/\">shortcut@</a>"), std::string::npos) << resp.body;
    EXPECT_EQ(resp.body.find("shortcut/@"), std::string::npos);
}

TEST_F(StaticFilesTest, FileWithTrailingSlashIsNotFound)
{
    const HttpResponse resp = handler_(request("GET", "/index.html/"));
    EXPECT_EQ(resp.status, 404);
}

TEST_F(StaticFilesTest, HeadKeepsHeadersAndDropsBody)
{
    const HttpResponse resp = handler_(request("HEAD", "/js/app.js"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.omitBody);
    EXPECT_EQ(resp.header("Content-Length").value_or(""), "18");
    EXPECT_EQ(resp.serialize().find("console.log"), std::string::npos);
    EXPECT_EQ(resp.header("Cache-Control").value_or(""), "no-cache");
}

TEST_F(StaticFilesTest, IfModifiedSinceAnswersNotModified)
{
    HttpRequest fresh = request("GET", "/index.html");
    fresh.headers.emplace_back("If-Modified-Since",
                               devserve::http::formatHttpDate(std::chrono::system_clock::now() + std::chrono::hours(24)));
    const HttpResponse notModified = handler_(fresh);
    EXPECT_EQ(notModified.status, 304);
    EXPECT_TRUE(notModified.body.empty());
    expectCors(notModified);

    HttpRequest stale = request("GET", "/index.html");
    stale.headers.emplace_back("If-Modified-Since", "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(handler_(stale).status, 200);
}

TEST_F(StaticFilesTest, OtherMethodsAreNotImplemented)
{
    const HttpResponse resp = handler_(request("POST", "/index.html"));
    EXPECT_EQ(resp.status, 501);
    EXPECT_NE(resp.body.find("Unsupported method ('POST')"), std::string::npos);
    expectCors(resp);
}

TEST_F(StaticFilesTest, SymlinkOutsideRootIsForbidden)
{
    const fs::path outside = makeTempRoot("outside");
    writeFile(outside / "secret.txt", "secret");

    std::error_code ec;
    fs::create_symlink(outside / "secret.txt", root_ / "leak.txt", ec);
    if (ec)
    {
        fs::remove_all(outside, ec);
        GTEST_SKIP() << "symlinks not supported here";
    }

    const HttpResponse resp = handler_(request("GET", "/leak.txt"));
    EXPECT_EQ(resp.status, 403);

    fs::remove_all(outside, ec);
}

TEST(Preflight, OptionsShortCircuitsWithoutCallingNext)
{
    int calls = 0;
    devserve::http::HttpHandler counting = [&calls](const HttpRequest &)
    {
        ++calls;
        HttpResponse resp;
        resp.body = "from filesystem";
        return resp;
    };
    auto handler = devserve::http::withCorsHeaders(devserve::http::withPreflight(counting));

    const HttpResponse resp = handler(request("OPTIONS", "/anything/at/all"));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(resp.header("Content-Length").value_or(""), "0");
    expectCors(resp);

    handler(request("GET", "/"));
    EXPECT_EQ(calls, 1);
}

TEST(Preflight, DevServerStackAnswersOptionsOnMissingRoot)
{
    auto handler = devserve::http::makeDevServerHandler("/devserve/this/root/does/not/exist");

    const HttpResponse resp = handler(request("OPTIONS", "/app.js"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.body.empty());
    expectCors(resp);
    EXPECT_EQ(resp.header("Cache-Control").value_or(""), "no-cache");
}

TEST(RequestPath, SanitizeStripsQueryFragmentAndDotSegments)
{
    fs::path rel;
    ASSERT_TRUE(devserve::http::sanitizeRequestPath("/assets/./img//logo.png?v=1#frag", rel));
    EXPECT_EQ(rel.generic_string(), "assets/img/logo.png");

    ASSERT_TRUE(devserve::http::sanitizeRequestPath("/", rel));
    EXPECT_TRUE(rel.empty());
}

TEST(RequestPath, SanitizeDecodesPercentEscapes)
{
    fs::path rel;
    ASSERT_TRUE(devserve::http::sanitizeRequestPath("/my%20notes/a+b.md", rel));
    EXPECT_EQ(rel.generic_string(), "my notes/a+b.md");
}

TEST(RequestPath, SanitizeRejectsTraversalAndControlCharacters)
{
    fs::path rel;
    EXPECT_FALSE(devserve::http::sanitizeRequestPath("/../etc/passwd", rel));
    EXPECT_FALSE(devserve::http::sanitizeRequestPath("/a/..\\..\\b", rel));
    EXPECT_FALSE(devserve::http::sanitizeRequestPath("/a%00b", rel));
    EXPECT_FALSE(devserve::http::sanitizeRequestPath("/a%0Ab", rel));
}

TEST(RequestPath, UrlEncodeKeepsSlashesAndUnreserved)
{
    EXPECT_EQ(devserve::http::urlEncodePath("dir/a b&c.txt"), "dir/a%20b%26c.txt");
    EXPECT_EQ(devserve::http::urlEncodePath("x-y_z.~"), "x-y_z.~");
}
