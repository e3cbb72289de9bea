#pragma once

namespace devserve {

constexpr const char *kAppName = "devserve";
constexpr const char *kVersion = "1.0.0";
constexpr const char *kServerHeader = "devserve/1.0.0";

} // namespace devserve
