#include "http/http_message.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace devserve::http
{
    namespace
    {

        std::string trim(const std::string &value)
        {
            std::size_t begin = 0;
            std::size_t end = value.size();
            while (begin < end && (value[begin] == ' ' || value[begin] == '\t'))
            {
                ++begin;
            }
            while (end > begin && (value[end - 1] == ' ' || value[end - 1] == '\t' || value[end - 1] == '\r'))
            {
                --end;
            }
            return value.substr(begin, end - begin);
        }

        bool equalsIgnoreCase(const std::string &a, const std::string &b)
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                {
                    return false;
                }
            }
            return true;
        }

        std::optional<std::string> findHeader(const std::vector<Header> &headers, const std::string &name)
        {
            for (const auto &[key, value] : headers)
            {
                if (equalsIgnoreCase(key, name))
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        bool hasNoBody(int status)
        {
            return (status >= 100 && status < 200) || status == 204 || status == 304;
        }

    } // namespace

    std::optional<std::string> HttpRequest::header(const std::string &name) const
    {
        return findHeader(headers, name);
    }

    std::string HttpRequest::requestLine() const
    {
        return method + " " + target + " " + version;
    }

    void HttpResponse::setHeader(const std::string &name, const std::string &value)
    {
        for (auto &[key, current] : headers)
        {
            if (equalsIgnoreCase(key, name))
            {
                current = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    std::optional<std::string> HttpResponse::header(const std::string &name) const
    {
        return findHeader(headers, name);
    }

    bool HttpResponse::hasHeader(const std::string &name) const
    {
        return findHeader(headers, name).has_value();
    }

    std::string HttpResponse::serialize() const
    {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + statusText(status) + "\r\n";
        for (const auto &[key, value] : headers)
        {
            out += key;
            out += ": ";
            out += value;
            out += "\r\n";
        }
        out += "\r\n";
        if (!omitBody && !hasNoBody(status))
        {
            out += body;
        }
        return out;
    }

    bool parseRequestHead(const std::string &head, HttpRequest &out, std::string &err)
    {
        const std::size_t firstEnd = head.find("\r\n");
        if (firstEnd == std::string::npos)
        {
            err = "Bad request syntax";
            return false;
        }

        const std::string firstLine = head.substr(0, firstEnd);
        const std::size_t p1 = firstLine.find(' ');
        if (p1 == std::string::npos)
        {
            err = "Bad request syntax (" + firstLine + ")";
            return false;
        }
        const std::size_t p2 = firstLine.find(' ', p1 + 1);
        if (p2 == std::string::npos)
        {
            err = "Bad request syntax (" + firstLine + ")";
            return false;
        }

        out.method = firstLine.substr(0, p1);
        out.target = firstLine.substr(p1 + 1, p2 - (p1 + 1));
        out.version = firstLine.substr(p2 + 1);
        if (out.method.empty() || out.target.empty())
        {
            err = "Bad request syntax (" + firstLine + ")";
            return false;
        }
        if (out.version.rfind("HTTP/", 0) != 0)
        {
            err = "Bad request version (" + out.version + ")";
            return false;
        }

        out.headers.clear();
        std::size_t begin = firstEnd + 2;
        while (begin < head.size())
        {
            std::size_t end = head.find("\r\n", begin);
            if (end == std::string::npos)
            {
                end = head.size();
            }
            const std::string line = head.substr(begin, end - begin);
            begin = end + 2;

            if (line.empty())
            {
                break;
            }

            const std::size_t colon = line.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                continue;
            }
            out.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        return true;
    }

    std::string statusText(int code)
    {
        switch (code)
        {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 301:
            return "Moved Permanently";
        case 304:
            return "Not Modified";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        default:
            return "Error";
        }
    }

    std::string formatHttpDate(std::chrono::system_clock::time_point when)
    {
        const std::time_t t = std::chrono::system_clock::to_time_t(when);
        std::tm utc{};
        gmtime_r(&t, &utc);
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::put_time(&utc, "%a, %d %b %Y %H:%M:%S GMT");
        return out.str();
    }

    std::optional<std::chrono::system_clock::time_point> parseHttpDate(const std::string &text)
    {
        std::tm utc{};
        std::istringstream in(trim(text));
        in.imbue(std::locale::classic());
        in >> std::get_time(&utc, "%a, %d %b %Y %H:%M:%S");
        if (in.fail())
        {
            return std::nullopt;
        }

        const std::time_t t = timegm(&utc);
        if (t == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    HttpResponse makeErrorResponse(int status, const std::string &message)
    {
        HttpResponse resp;
        resp.status = status;

        std::ostringstream body;
        body << "<!DOCTYPE HTML>\n"
             << "<html lang=\"en\">\n"
             << "    <head>\n"
             << "        <meta charset=\"utf-8\">\n"
             << "        <title>Error response</title>\n"
             << "    </head>\n"
             << "    <body>\n"
             << "        <h1>Error response</h1>\n"
             << "        <p>Error code: " << status << "</p>\n"
             << "        <p>Message: " << htmlEscape(message) << ".</p>\n"
             << "    </body>\n"
             << "</html>\n";

        if (!hasNoBody(status))
        {
            resp.body = body.str();
            resp.setHeader("Content-Type", "text/html;charset=utf-8");
        }
        resp.setHeader("Content-Length", std::to_string(resp.body.size()));
        return resp;
    }

    std::string htmlEscape(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out.push_back(c);
            }
        }
        return out;
    }

    std::string toLower(std::string value)
    {
        for (char &ch : value)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return value;
    }

} // namespace devserve::http
