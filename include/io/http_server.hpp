#pragma once

#include <string>

#include "core/context.hpp"
#include "http/handlers.hpp"
#include "io/socket.hpp"

namespace devserve::io {

constexpr const char *kListenAllInterfaces = "0.0.0.0";

// One listening socket and a blocking accept loop that handles one
// connection at a time through the given handler.
class StaticHttpServer {
public:
    StaticHttpServer(const devserve::Context &ctx, devserve::http::HttpHandler handler);
    ~StaticHttpServer();

    StaticHttpServer(const StaticHttpServer &) = delete;
    StaticHttpServer &operator=(const StaticHttpServer &) = delete;

    // Port 0 binds an ephemeral port; port() reports the real one afterwards.
    bool bind(const std::string &host, int port, std::string &err);

    // Blocks until stopHttpServer() is called. Returns false when the loop
    // fails, with the reason in err.
    bool serve(std::string &err);

    void close();

    bool isBound() const { return listener_ != kInvalidSocket; }
    int port() const { return port_; }

private:
    void handleClient(SocketHandle client) const;
    void sendResponse(SocketHandle client, devserve::http::HttpResponse resp, const std::string &requestLine) const;

    const devserve::Context &ctx_;
    devserve::http::HttpHandler handler_;
    SocketHandle listener_ = kInvalidSocket;
    int port_ = 0;
};

// Async-signal-safe: only flips the flag the accept loop polls.
void stopHttpServer();

} // namespace devserve::io
