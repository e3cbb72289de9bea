#pragma once

#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace devserve::io {

using SocketHandle = int;
constexpr SocketHandle kInvalidSocket = -1;

// TCP socket with FD_CLOEXEC set, so launched processes never inherit it.
SocketHandle openTcpSocket();
void closeSocket(SocketHandle handle);
std::string socketErrorText();
bool setReuseAddress(SocketHandle sock);
bool setReceiveTimeout(SocketHandle sock, int seconds);

// Fills addr for host:port. host must be a dotted IPv4 address.
bool makeInetAddress(const std::string &host, int port, sockaddr_in &addr);

} // namespace devserve::io
