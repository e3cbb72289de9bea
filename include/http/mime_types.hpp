#pragma once

#include <filesystem>
#include <string>

namespace devserve::http {

// Content-Type for a file, by extension. Unknown types are application/octet-stream.
std::string detectMimeType(const std::filesystem::path &path);

} // namespace devserve::http
