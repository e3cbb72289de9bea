#pragma once

#include <optional>
#include <string>

namespace devserve::io {

constexpr int kDefaultFirstPort = 8000;
constexpr int kDefaultPortLimit = 8100;
constexpr const char *kProbeHost = "127.0.0.1";

// Binds and immediately releases a socket on host:port.
bool isHttpPortAvailable(const std::string &host, int port);

// First available port in [firstPort, portLimit), probing in ascending order.
std::optional<int> findFreePort(
    const std::string &host = kProbeHost,
    int firstPort = kDefaultFirstPort,
    int portLimit = kDefaultPortLimit
);

std::string describePortRange(int firstPort, int portLimit);

} // namespace devserve::io
