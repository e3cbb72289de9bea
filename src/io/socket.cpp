#include "io/socket.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/time.h>

namespace devserve::io
{

    SocketHandle openTcpSocket()
    {
        SocketHandle sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (sock == kInvalidSocket)
        {
            return kInvalidSocket;
        }
        const int flags = fcntl(sock, F_GETFD);
        if (flags < 0 || fcntl(sock, F_SETFD, flags | FD_CLOEXEC) != 0)
        {
            closeSocket(sock);
            return kInvalidSocket;
        }
        return sock;
    }

    void closeSocket(SocketHandle handle)
    {
        if (handle == kInvalidSocket)
        {
            return;
        }
        close(handle);
    }

    std::string socketErrorText()
    {
        return std::strerror(errno);
    }

    bool setReuseAddress(SocketHandle sock)
    {
        int reuse = 1;
        return setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == 0;
    }

    bool setReceiveTimeout(SocketHandle sock, int seconds)
    {
        struct timeval tv;
        tv.tv_sec = seconds;
        tv.tv_usec = 0;
        return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    }

    bool makeInetAddress(const std::string &host, int port, sockaddr_in &addr)
    {
        if (port < 0 || port > 65535)
        {
            return false;
        }

        addr = sockaddr_in{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<unsigned short>(port));
        return inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1;
    }

} // namespace devserve::io
