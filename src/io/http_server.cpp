#include "io/http_server.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <exception>
#include <utility>

#include <sys/select.h>

#include "core/version.hpp"

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace devserve::io
{
    namespace
    {

        constexpr std::size_t kMaxHeaderSize = 64 * 1024;
        constexpr std::size_t kRecvBufferSize = 4 * 1024;
        constexpr int kListenBacklog = 128;
        constexpr int kSocketTimeoutSeconds = 30;

        std::atomic<bool> g_serverRunning{true};

        bool sendAll(SocketHandle sock, const char *data, std::size_t size)
        {
            std::size_t sent = 0;
            while (sent < size)
            {
                const std::size_t toSend = std::min(size - sent, static_cast<std::size_t>(INT_MAX));
                const ssize_t n = send(sock, data + sent, toSend, MSG_NOSIGNAL);
                if (n < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    {
                        continue;
                    }
                    return false;
                }
                if (n == 0)
                {
                    return false;
                }
                sent += static_cast<std::size_t>(n);
            }
            return true;
        }

        enum class ReadStatus
        {
            Complete,
            Closed,
            TooLarge,
        };

        ReadStatus readRequestHead(SocketHandle client, std::string &request)
        {
            std::array<char, kRecvBufferSize> buffer{};
            for (;;)
            {
                if (request.size() >= kMaxHeaderSize)
                {
                    return ReadStatus::TooLarge;
                }

                const std::size_t canRead = std::min(buffer.size(), kMaxHeaderSize - request.size());
                const ssize_t got = recv(client, buffer.data(), canRead, 0);
                if (got < 0 && errno == EINTR)
                {
                    // A stop signal must not wait for an idle client's timeout.
                    if (!g_serverRunning)
                    {
                        return ReadStatus::Closed;
                    }
                    continue;
                }
                if (got <= 0)
                {
                    return ReadStatus::Closed;
                }

                request.append(buffer.data(), static_cast<std::size_t>(got));
                const std::size_t end = request.find("\r\n\r\n");
                if (end != std::string::npos)
                {
                    request.resize(end + 4);
                    return ReadStatus::Complete;
                }
            }
        }

        std::string firstLineOf(const std::string &request)
        {
            const std::size_t end = request.find("\r\n");
            return end == std::string::npos ? request : request.substr(0, end);
        }

    } // namespace

    StaticHttpServer::StaticHttpServer(const devserve::Context &ctx, devserve::http::HttpHandler handler)
        : ctx_(ctx), handler_(std::move(handler))
    {
        g_serverRunning = true;
    }

    StaticHttpServer::~StaticHttpServer()
    {
        close();
    }

    bool StaticHttpServer::bind(const std::string &hostInput, int port, std::string &err)
    {
        if (port < 0 || port > 65535)
        {
            err = "Invalid HTTP server port: " + std::to_string(port);
            return false;
        }

        const std::string host = hostInput.empty() ? kListenAllInterfaces : hostInput;
        sockaddr_in addr{};
        if (!makeInetAddress(host, port, addr))
        {
            err = "Invalid HTTP server host: " + host;
            return false;
        }

        close();
        SocketHandle server = openTcpSocket();
        if (server == kInvalidSocket)
        {
            err = "Failed create socket: " + socketErrorText();
            return false;
        }

        setReuseAddress(server);

        if (::bind(server, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
        {
            err = "Failed bind " + host + ":" + std::to_string(port) + " : " + socketErrorText();
            closeSocket(server);
            return false;
        }

        if (listen(server, kListenBacklog) != 0)
        {
            err = "Failed listen on " + host + ":" + std::to_string(port) + " : " + socketErrorText();
            closeSocket(server);
            return false;
        }

        sockaddr_in bound{};
        socklen_t boundLen = sizeof(bound);
        if (getsockname(server, reinterpret_cast<sockaddr *>(&bound), &boundLen) == 0)
        {
            port_ = ntohs(bound.sin_port);
        }
        else
        {
            port_ = port;
        }

        listener_ = server;
        return true;
    }

    bool StaticHttpServer::serve(std::string &err)
    {
        if (!isBound())
        {
            err = "HTTP server is not bound";
            return false;
        }

        while (g_serverRunning)
        {
            // select with a timeout so a stop request is seen even when idle
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(listener_, &readfds);

            struct timeval tv;
            tv.tv_sec = 1;
            tv.tv_usec = 0;

            const int selectResult = select(listener_ + 1, &readfds, nullptr, nullptr, &tv);
            if (selectResult < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                err = "Select failed: " + socketErrorText();
                return false;
            }
            if (selectResult == 0)
            {
                continue;
            }

            sockaddr_in clientAddr{};
            socklen_t addrLen = sizeof(clientAddr);
            SocketHandle client = accept(listener_, reinterpret_cast<sockaddr *>(&clientAddr), &addrLen);
            if (client == kInvalidSocket)
            {
                if (!g_serverRunning)
                {
                    break;
                }
                if (errno != EINTR && errno != ECONNABORTED)
                {
                    ctx_.warn("Accept failed: ", socketErrorText());
                }
                continue;
            }

            handleClient(client);
            closeSocket(client);
        }

        close();
        return true;
    }

    void StaticHttpServer::close()
    {
        closeSocket(listener_);
        listener_ = kInvalidSocket;
    }

    void StaticHttpServer::handleClient(SocketHandle client) const
    {
        setReceiveTimeout(client, kSocketTimeoutSeconds);

        std::string request;
        request.reserve(kRecvBufferSize);

        const ReadStatus status = readRequestHead(client, request);
        if (status == ReadStatus::Closed)
        {
            return;
        }
        if (status == ReadStatus::TooLarge)
        {
            sendResponse(client, devserve::http::makeErrorResponse(431, "Request header too large"), firstLineOf(request));
            return;
        }

        devserve::http::HttpRequest req;
        std::string parseErr;
        if (!devserve::http::parseRequestHead(request, req, parseErr))
        {
            sendResponse(client, devserve::http::makeErrorResponse(400, parseErr), firstLineOf(request));
            return;
        }

        devserve::http::HttpResponse resp;
        try
        {
            resp = handler_(req);
        }
        catch (const std::exception &e)
        {
            ctx_.error("Request handler failed for ", req.target, ": ", e.what());
            resp = devserve::http::makeErrorResponse(500, "Internal server error");
            devserve::http::addCorsHeaders(resp);
        }
        sendResponse(client, std::move(resp), req.requestLine());
    }

    void StaticHttpServer::sendResponse(SocketHandle client, devserve::http::HttpResponse resp, const std::string &requestLine) const
    {
        if (!resp.hasHeader("Access-Control-Allow-Origin"))
        {
            devserve::http::addCorsHeaders(resp);
        }
        resp.headers.insert(resp.headers.begin(), devserve::http::Header("Date", devserve::http::formatHttpDate(std::chrono::system_clock::now())));
        resp.headers.insert(resp.headers.begin(), devserve::http::Header("Server", kServerHeader));
        resp.setHeader("Connection", "close");

        const std::string wire = resp.serialize();
        ctx_.access(requestLine, resp.status, resp.omitBody ? 0 : resp.body.size());
        if (!sendAll(client, wire.data(), wire.size()))
        {
            ctx_.warn("Failed to send response: ", socketErrorText());
        }
    }

    void stopHttpServer()
    {
        g_serverRunning = false;
    }

} // namespace devserve::io
