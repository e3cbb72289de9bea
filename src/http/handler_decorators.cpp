#include "http/handlers.hpp"

#include <utility>

namespace devserve::http
{
    namespace
    {

        bool endsWith(const std::string &value, const std::string &suffix)
        {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

    } // namespace

    void addCorsHeaders(HttpResponse &resp)
    {
        resp.setHeader("Access-Control-Allow-Origin", "*");
        resp.setHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        resp.setHeader("Access-Control-Allow-Headers", "Content-Type");
    }

    HttpHandler withCorsHeaders(HttpHandler next)
    {
        return [next = std::move(next)](const HttpRequest &req)
        {
            HttpResponse resp = next(req);
            addCorsHeaders(resp);
            return resp;
        };
    }

    HttpHandler withNoCacheForAssets(HttpHandler next)
    {
        return [next = std::move(next)](const HttpRequest &req)
        {
            HttpResponse resp = next(req);
            // Matches the raw target, so "/app.js?v=2" is left alone.
            if (endsWith(req.target, ".js") || endsWith(req.target, ".css"))
            {
                resp.setHeader("Cache-Control", "no-cache");
            }
            return resp;
        };
    }

    HttpHandler withPreflight(HttpHandler next)
    {
        return [next = std::move(next)](const HttpRequest &req)
        {
            if (req.method != "OPTIONS")
            {
                return next(req);
            }
            HttpResponse resp;
            resp.status = 200;
            resp.setHeader("Content-Length", "0");
            return resp;
        };
    }

    HttpHandler makeDevServerHandler(const std::filesystem::path &root, const std::string &indexFile)
    {
        return withNoCacheForAssets(withCorsHeaders(withPreflight(makeStaticFileHandler(root, indexFile))));
    }

} // namespace devserve::http
