#include "http/mime_types.hpp"

#include <unordered_map>

#include "http/http_message.hpp"

namespace devserve::http
{

    std::string detectMimeType(const std::filesystem::path &path)
    {
        static const std::unordered_map<std::string, std::string> kTable = {
            {".html", "text/html; charset=utf-8"},
            {".htm", "text/html; charset=utf-8"},
            {".js", "application/javascript; charset=utf-8"},
            {".mjs", "application/javascript; charset=utf-8"},
            {".css", "text/css; charset=utf-8"},
            {".json", "application/json; charset=utf-8"},
            {".map", "application/json; charset=utf-8"},
            {".txt", "text/plain; charset=utf-8"},
            {".md", "text/markdown; charset=utf-8"},
            {".csv", "text/csv; charset=utf-8"},
            {".xml", "application/xml; charset=utf-8"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".wasm", "application/wasm"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".svg", "image/svg+xml"},
            {".ico", "image/x-icon"},
            {".woff", "font/woff"},
            {".woff2", "font/woff2"},
            {".ttf", "font/ttf"},
            {".otf", "font/otf"},
            {".wav", "audio/wav"},
            {".ogg", "audio/ogg"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".webm", "video/webm"},
        };

        const std::string ext = toLower(path.extension().string());
        auto it = kTable.find(ext);
        if (it != kTable.end())
        {
            return it->second;
        }
        return "application/octet-stream";
    }

} // namespace devserve::http
