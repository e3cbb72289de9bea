#include "commands/serve_command.hpp"

#include <algorithm>
#include <csignal>
#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/version.hpp"
#include "http/handlers.hpp"
#include "io/browser.hpp"
#include "io/http_server.hpp"

namespace fs = std::filesystem;

namespace devserve::commands
{
    namespace
    {

        void onStopSignal(int)
        {
            devserve::io::stopHttpServer();
        }

        // No SA_RESTART: select() in the accept loop must wake up with EINTR.
        void installStopSignals()
        {
            struct sigaction action{};
            action.sa_handler = onStopSignal;
            sigemptyset(&action.sa_mask);
            action.sa_flags = 0;
            sigaction(SIGINT, &action, nullptr);
            sigaction(SIGTERM, &action, nullptr);

            struct sigaction ignore{};
            ignore.sa_handler = SIG_IGN;
            sigemptyset(&ignore.sa_mask);
            sigaction(SIGPIPE, &ignore, nullptr);
        }

        bool parsePort(const std::string &flag, const std::string &value, int maxValue, int &out, const devserve::Context &ctx)
        {
            try
            {
                std::size_t used = 0;
                const int port = std::stoi(value, &used);
                if (used != value.size() || port <= 0 || port > maxValue)
                {
                    ctx.error("Invalid ", flag, " value: ", value);
                    return false;
                }
                out = port;
                return true;
            }
            catch (const std::exception &)
            {
                ctx.error("Invalid ", flag, " value: ", value);
                return false;
            }
        }

        void printBanner(const devserve::Context &ctx, const std::string &url, const fs::path &root)
        {
            ctx.log(devserve::kAppName, " ", devserve::kVersion, " is running");
            ctx.log("  Server URL:  ", url);
            ctx.log("  Serving:     ", root.string());
            ctx.log("  Press Ctrl+C to stop the server.");
            ctx.log(std::string(50, '-'));
        }

        ServeResult fail(ServeError error, std::string message)
        {
            ServeResult result;
            result.error = error;
            result.message = std::move(message);
            return result;
        }

    } // namespace

    bool parseServeOptions(const std::vector<std::string> &args, ServeOptions &opt, const devserve::Context &ctx)
    {
        std::vector<std::string> positionals;
        bool portLimitGiven = false;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--port" || arg == "--max-port" || arg == "--bind" || arg == "--root" || arg == "--index")
            {
                if (i + 1 >= args.size())
                {
                    ctx.error(arg, " requires value");
                    return false;
                }
                const std::string &value = args[++i];

                if (arg == "--port")
                {
                    if (!parsePort(arg, value, 65535, opt.firstPort, ctx))
                    {
                        return false;
                    }
                }
                else if (arg == "--max-port")
                {
                    if (!parsePort(arg, value, 65536, opt.portLimit, ctx))
                    {
                        return false;
                    }
                    portLimitGiven = true;
                }
                else if (arg == "--bind")
                {
                    opt.host = value;
                }
                else if (arg == "--root")
                {
                    opt.root = value;
                }
                else
                {
                    opt.indexFile = value;
                }
                continue;
            }
            if (arg == "--no-open")
            {
                opt.openBrowser = false;
                continue;
            }
            if (arg == "--open")
            {
                opt.openBrowser = true;
                continue;
            }

            if (arg.rfind("--", 0) == 0)
            {
                ctx.error("Unknown serve option: ", arg);
                return false;
            }
            positionals.push_back(arg);
        }

        if (positionals.size() > 1)
        {
            ctx.error("serve: expected at most one directory, got ", positionals.size());
            return false;
        }
        if (!positionals.empty())
        {
            opt.root = positionals[0];
        }

        // Keep the default scan width when only the first port moved.
        if (!portLimitGiven && opt.portLimit <= opt.firstPort)
        {
            opt.portLimit = std::min(opt.firstPort + (devserve::io::kDefaultPortLimit - devserve::io::kDefaultFirstPort), 65536);
        }
        if (opt.portLimit <= opt.firstPort)
        {
            ctx.error("--max-port must be greater than --port (", opt.portLimit, " <= ", opt.firstPort, ")");
            return false;
        }
        if (opt.indexFile.empty())
        {
            ctx.error("--index must not be empty");
            return false;
        }
        return true;
    }

    namespace
    {

        ServeResult startAndServe(const devserve::Context &ctx, const ServeOptions &opt)
        {
            std::error_code ec;
            const fs::path root = fs::absolute(opt.root, ec);
            if (ec || !fs::is_directory(root, ec))
            {
                return fail(ServeError::MissingEntryFile, opt.indexFile + " not found: serving directory " + opt.root.string() + " does not exist");
            }

            const fs::path entry = root / opt.indexFile;
            if (!fs::is_regular_file(entry, ec))
            {
                return fail(ServeError::MissingEntryFile, opt.indexFile + " not found in " + root.string());
            }

            const auto port = devserve::io::findFreePort(devserve::io::kProbeHost, opt.firstPort, opt.portLimit);
            if (!port.has_value())
            {
                return fail(ServeError::NoFreePort,
                            "No free port found in range " + devserve::io::describePortRange(opt.firstPort, opt.portLimit));
            }

            installStopSignals();
            devserve::io::StaticHttpServer server(ctx, devserve::http::makeDevServerHandler(root, opt.indexFile));
            std::string err;
            if (!server.bind(opt.host, *port, err))
            {
                return fail(ServeError::BindFailed, err);
            }

            const std::string url = "http://localhost:" + std::to_string(server.port());
            if (opt.openBrowser)
            {
                std::string browserErr;
                if (devserve::io::openBrowser(url, browserErr))
                {
                    ctx.log("Opened ", url, " in the default browser");
                }
                else
                {
                    ctx.warn("Could not open the browser automatically: ", browserErr);
                    ctx.log("Please open ", url, " manually");
                }
            }

            printBanner(ctx, url, root);

            ServeResult result;
            result.port = server.port();
            if (!server.serve(err))
            {
                result.error = ServeError::ServeFailed;
                result.message = err;
            }
            return result;
        }

    } // namespace

    ServeResult runDevServer(const devserve::Context &ctx, const ServeOptions &opt)
    {
        try
        {
            return startAndServe(ctx, opt);
        }
        catch (const std::exception &e)
        {
            return fail(ServeError::ServeFailed, e.what());
        }
    }

    int reportServeResult(const devserve::Context &ctx, const ServeOptions &opt, const ServeResult &result)
    {
        switch (result.error)
        {
        case ServeError::None:
            ctx.log("");
            ctx.log("Server stopped. Goodbye!");
            return 0;
        case ServeError::InvalidOptions:
            ctx.error(result.message);
            return 1;
        case ServeError::MissingEntryFile:
            ctx.error(result.message);
            ctx.log("Run ", devserve::kAppName, " from the project directory that contains ", opt.indexFile,
                    ", or pass --root DIR.");
            return 1;
        case ServeError::NoFreePort:
            ctx.error(result.message);
            return 1;
        case ServeError::BindFailed:
            ctx.error("Server failed to start: ", result.message);
            return 1;
        case ServeError::ServeFailed:
            ctx.error("Server stopped unexpectedly: ", result.message);
            return 1;
        }
        return 1;
    }

    int runServeCommand(const devserve::Context &ctx, const fs::path &workingDir, const std::vector<std::string> &args)
    {
        ServeOptions opt;
        if (!parseServeOptions(args, opt, ctx))
        {
            return reportServeResult(ctx, opt, fail(ServeError::InvalidOptions, "Invalid serve options; see --help"));
        }

        if (opt.root.empty())
        {
            opt.root = workingDir;
        }
        else if (!opt.root.is_absolute())
        {
            opt.root = workingDir / opt.root;
        }

        return reportServeResult(ctx, opt, runDevServer(ctx, opt));
    }

} // namespace devserve::commands
