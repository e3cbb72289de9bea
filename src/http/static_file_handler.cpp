#include "http/handlers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

#include "http/mime_types.hpp"

namespace fs = std::filesystem;

namespace devserve::http
{
    namespace
    {

        int hexValue(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f')
            {
                return 10 + (c - 'a');
            }
            return -1;
        }

        // "/a/b?x=1#top" -> path "/a/b", query "x=1"
        void splitTarget(const std::string &target, std::string &pathOut, std::string &queryOut)
        {
            std::string rest = target;
            const std::size_t h = rest.find('#');
            if (h != std::string::npos)
            {
                rest = rest.substr(0, h);
            }
            const std::size_t q = rest.find('?');
            if (q != std::string::npos)
            {
                queryOut = rest.substr(q + 1);
                rest = rest.substr(0, q);
            }
            else
            {
                queryOut.clear();
            }
            pathOut = rest;
        }

        std::optional<std::time_t> modificationTime(const fs::path &path)
        {
            struct stat st;
            if (::stat(path.string().c_str(), &st) != 0)
            {
                return std::nullopt;
            }
            return st.st_mtime;
        }

        HttpResponse finish(HttpResponse resp, bool headOnly)
        {
            resp.omitBody = headOnly;
            return resp;
        }

        class StaticFileHandler
        {
        public:
            StaticFileHandler(fs::path root, std::string indexFile)
                : root_(std::move(root)), indexFile_(std::move(indexFile))
            {
            }

            HttpResponse operator()(const HttpRequest &req) const
            {
                const bool headOnly = req.method == "HEAD";
                if (req.method != "GET" && !headOnly)
                {
                    return makeErrorResponse(501, "Unsupported method ('" + req.method + "')");
                }

                std::string pathPart;
                std::string query;
                splitTarget(req.target, pathPart, query);

                fs::path rel;
                if (!sanitizeRequestPath(req.target, rel))
                {
                    return finish(makeErrorResponse(403, "Forbidden"), headOnly);
                }

                fs::path filePath = root_ / rel;
                const bool trailingSlash = !pathPart.empty() && pathPart.back() == '/';

                std::error_code ec;
                if (fs::is_directory(filePath, ec))
                {
                    if (!trailingSlash)
                    {
                        return finish(redirectToDirectory(pathPart, query), headOnly);
                    }
                    if (!isPathSafe(filePath, root_))
                    {
                        return finish(makeErrorResponse(403, "Forbidden"), headOnly);
                    }

                    auto index = findIndexFile(filePath);
                    if (!index.has_value())
                    {
                        return finish(listDirectory(filePath, pathPart), headOnly);
                    }
                    filePath = *index;
                }
                else if (trailingSlash)
                {
                    return finish(makeErrorResponse(404, "File not found"), headOnly);
                }

                if (!fs::is_regular_file(filePath, ec))
                {
                    return finish(makeErrorResponse(404, "File not found"), headOnly);
                }
                if (!isPathSafe(filePath, root_))
                {
                    return finish(makeErrorResponse(403, "Forbidden"), headOnly);
                }
                return finish(sendFile(req, filePath, headOnly), headOnly);
            }

        private:
            HttpResponse redirectToDirectory(const std::string &pathPart, const std::string &query) const
            {
                HttpResponse resp;
                resp.status = 301;
                std::string location = pathPart + "/";
                if (!query.empty())
                {
                    location += "?" + query;
                }
                resp.setHeader("Location", location);
                resp.setHeader("Content-Length", "0");
                return resp;
            }

            std::optional<fs::path> findIndexFile(const fs::path &dir) const
            {
                std::vector<std::string> candidates = {indexFile_, "index.html", "index.htm"};
                std::error_code ec;
                for (const auto &name : candidates)
                {
                    if (name.empty())
                    {
                        continue;
                    }
                    const fs::path candidate = dir / name;
                    if (fs::is_regular_file(candidate, ec))
                    {
                        return candidate;
                    }
                }
                return std::nullopt;
            }

            HttpResponse listDirectory(const fs::path &dir, const std::string &pathPart) const
            {
                struct Entry
                {
                    std::string name;
                    bool isDir = false;
                    bool isLink = false;
                };

                std::vector<Entry> entries;
                std::error_code ec;
                fs::directory_iterator it(dir, ec);
                if (ec)
                {
                    return makeErrorResponse(404, "No permission to list directory");
                }
                for (const auto &item : it)
                {
                    Entry entry;
                    entry.name = item.path().filename().string();
                    entry.isDir = item.is_directory(ec);
                    entry.isLink = item.is_symlink(ec);
                    entries.push_back(entry);
                }

                std::sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b)
                          { return toLower(a.name) < toLower(b.name); });

                const std::string title = "Directory listing for " + htmlEscape(urlDecode(pathPart));

                std::ostringstream body;
                body << "<!DOCTYPE HTML>\n"
                     << "<html lang=\"en\">\n"
                     << "<head>\n"
                     << "<meta charset=\"utf-8\">\n"
                     << "<title>" << title << "</title>\n"
                     << "</head>\n"
                     << "<body>\n"
                     << "<h1>" << title << "</h1>\n"
                     << "<hr>\n<ul>\n";
                for (const auto &entry : entries)
                {
                    std::string display = entry.name;
                    std::string link = entry.name;
                    if (entry.isDir)
                    {
                        display += "/";
                        link += "/";
                    }
                    if (entry.isLink)
                    {
                        display = entry.name + "@";
                    }
                    body << "<li><a href=\"" << urlEncodePath(link) << "\">" << htmlEscape(display) << "</a></li>\n";
                }
                body << "</ul>\n<hr>\n</body>\n</html>\n";

                HttpResponse resp;
                resp.status = 200;
                resp.body = body.str();
                resp.setHeader("Content-Type", "text/html; charset=utf-8");
                resp.setHeader("Content-Length", std::to_string(resp.body.size()));
                return resp;
            }

            HttpResponse sendFile(const HttpRequest &req, const fs::path &filePath, bool headOnly) const
            {
                const std::optional<std::time_t> mtime = modificationTime(filePath);

                if (mtime.has_value() && !req.header("If-None-Match").has_value())
                {
                    const auto since = req.header("If-Modified-Since");
                    if (since.has_value())
                    {
                        const auto sinceTime = parseHttpDate(*since);
                        if (sinceTime.has_value() && std::chrono::system_clock::from_time_t(*mtime) <= *sinceTime)
                        {
                            HttpResponse resp;
                            resp.status = 304;
                            resp.setHeader("Last-Modified", formatHttpDate(std::chrono::system_clock::from_time_t(*mtime)));
                            return resp;
                        }
                    }
                }

                std::ifstream in(filePath, std::ios::binary);
                if (!in.is_open())
                {
                    return makeErrorResponse(404, "File not found");
                }

                std::error_code ec;
                const std::uintmax_t size = fs::file_size(filePath, ec);
                if (ec)
                {
                    return makeErrorResponse(500, "Failed to read file size");
                }

                HttpResponse resp;
                resp.status = 200;
                if (!headOnly)
                {
                    std::ostringstream data;
                    data << in.rdbuf();
                    resp.body = data.str();
                }

                resp.setHeader("Content-Type", detectMimeType(filePath));
                resp.setHeader("Content-Length", std::to_string(headOnly ? size : resp.body.size()));
                if (mtime.has_value())
                {
                    resp.setHeader("Last-Modified", formatHttpDate(std::chrono::system_clock::from_time_t(*mtime)));
                }
                return resp;
            }

            fs::path root_;
            std::string indexFile_;
        };

    } // namespace

    std::string urlDecode(const std::string &raw)
    {
        std::string out;
        out.reserve(raw.size());

        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            const char ch = raw[i];
            if (ch == '%' && i + 2 < raw.size())
            {
                const int hi = hexValue(raw[i + 1]);
                const int lo = hexValue(raw[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(ch);
        }
        return out;
    }

    std::string urlEncodePath(const std::string &raw)
    {
        static const char *kHex = "0123456789ABCDEF";
        std::string out;
        out.reserve(raw.size());
        for (char ch : raw)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || ch == '-' || ch == '.' || ch == '_' || ch == '~' || ch == '/')
            {
                out.push_back(ch);
                continue;
            }
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
        return out;
    }

    bool sanitizeRequestPath(const std::string &rawTarget, fs::path &relativeOut)
    {
        std::string target;
        std::string query;
        splitTarget(rawTarget, target, query);

        std::string decoded = urlDecode(target);

        for (char &ch : decoded)
        {
            if (ch == '\\')
            {
                ch = '/';
            }
        }

        fs::path rel;
        std::size_t begin = 0;
        while (begin <= decoded.size())
        {
            std::size_t end = decoded.find('/', begin);
            if (end == std::string::npos)
            {
                end = decoded.size();
            }

            const std::string token = decoded.substr(begin, end - begin);
            begin = end + 1;

            if (token.empty() || token == ".")
            {
                continue;
            }
            if (token == "..")
            {
                return false;
            }
            for (char ch : token)
            {
                // NUL included
                if (static_cast<unsigned char>(ch) < 32 || ch == 127)
                {
                    return false;
                }
            }

            rel /= token;
        }

        relativeOut = rel;
        return true;
    }

    bool isPathSafe(const fs::path &filePath, const fs::path &serveRoot)
    {
        std::error_code ec;

        const fs::path canonicalFile = fs::canonical(filePath, ec);
        if (ec)
        {
            return false;
        }

        const fs::path canonicalRoot = fs::canonical(serveRoot, ec);
        if (ec)
        {
            return false;
        }

        auto fileIt = canonicalFile.begin();
        auto rootIt = canonicalRoot.begin();
        while (rootIt != canonicalRoot.end())
        {
            // Trailing "" component of a root ending in a separator
            if (rootIt->empty())
            {
                ++rootIt;
                continue;
            }
            if (fileIt == canonicalFile.end() || *fileIt != *rootIt)
            {
                return false;
            }
            ++fileIt;
            ++rootIt;
        }
        return true;
    }

    HttpHandler makeStaticFileHandler(const fs::path &root, const std::string &indexFile)
    {
        return StaticFileHandler(root, indexFile);
    }

} // namespace devserve::http
