#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "io/port_finder.hpp"

namespace devserve::commands {

struct ServeOptions {
    std::filesystem::path root;
    std::string host = "0.0.0.0";
    int firstPort = devserve::io::kDefaultFirstPort;
    int portLimit = devserve::io::kDefaultPortLimit;
    std::string indexFile = "index.html";
    bool openBrowser = true;
};

enum class ServeError {
    None,
    InvalidOptions,
    MissingEntryFile,
    NoFreePort,
    BindFailed,
    ServeFailed,
};

struct ServeResult {
    ServeError error = ServeError::None;
    std::string message;
    int port = 0;
};

bool parseServeOptions(const std::vector<std::string> &args, ServeOptions &opt, const devserve::Context &ctx);

// CheckingEntryFile -> PortScan -> Bind -> BrowserLaunch -> Serving.
// Returns once the server was stopped or a step failed.
ServeResult runDevServer(const devserve::Context &ctx, const ServeOptions &opt);

// Prints the outcome of runDevServer and maps it to the process exit code.
int reportServeResult(const devserve::Context &ctx, const ServeOptions &opt, const ServeResult &result);

int runServeCommand(
    const devserve::Context &ctx,
    const std::filesystem::path &workingDir,
    const std::vector<std::string> &args
);

} // namespace devserve::commands
