#include "io/port_finder.hpp"

#include "io/socket.hpp"

namespace devserve::io
{

    bool isHttpPortAvailable(const std::string &hostInput, int port)
    {
        if (port <= 0 || port > 65535)
        {
            return false;
        }

        const std::string host = hostInput.empty() ? kProbeHost : hostInput;
        sockaddr_in addr{};
        if (!makeInetAddress(host, port, addr))
        {
            return false;
        }

        // No SO_REUSEADDR: on BSD it would let this bind succeed next to a
        // wildcard listener on the same port.
        SocketHandle probe = openTcpSocket();
        if (probe == kInvalidSocket)
        {
            return false;
        }

        const bool available = bind(probe, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
        closeSocket(probe);
        return available;
    }

    std::optional<int> findFreePort(const std::string &host, int firstPort, int portLimit)
    {
        for (int port = firstPort; port < portLimit; ++port)
        {
            if (isHttpPortAvailable(host, port))
            {
                return port;
            }
        }
        return std::nullopt;
    }

    std::string describePortRange(int firstPort, int portLimit)
    {
        return std::to_string(firstPort) + "-" + std::to_string(portLimit);
    }

} // namespace devserve::io
