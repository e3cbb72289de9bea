#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devserve::io {

std::string shellQuote(const std::string &value);

// Starts command in its own session and returns once it has been exec'd,
// without waiting for it to finish. On failure err names the command and
// the reason (fork, setsid or exec errno).
bool launchDetached(const std::string &command, const std::vector<std::string> &args, std::string &err);

// Resolves a bare command name against PATH. Names containing a separator are
// checked as given.
std::optional<std::filesystem::path> findExecutable(const std::string &name);

} // namespace devserve::io
