#pragma once

#include <string>

namespace devserve::io {

// Command used to open URLs: $BROWSER when set, otherwise the platform opener.
std::string browserCommand();

// Opens url in the default browser without waiting for it. On failure err
// holds the reason.
bool openBrowser(const std::string &url, std::string &err);

} // namespace devserve::io
