#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "commands/serve_command.hpp"
#include "core/context.hpp"
#include "core/version.hpp"

namespace fs = std::filesystem;

namespace
{

    void printHelp()
    {
        const char *app = devserve::kAppName;
        std::cout << app << " " << devserve::kVersion << " - local development server\n"
                  << "\n"
                  << "Serves the current directory over HTTP with permissive CORS headers,\n"
                  << "picks the first free port and opens the default browser.\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << app << " [serve] [DIR] [options]\n"
                  << "  " << app << " help\n"
                  << "  " << app << " version\n"
                  << "\n"
                  << "Options:\n"
                  << "  --root DIR      directory to serve (default: current directory)\n"
                  << "  --port N        first port to try (default: 8000)\n"
                  << "  --max-port N    end of the port range, exclusive (default: 8100)\n"
                  << "  --bind HOST     listen address (default: 0.0.0.0)\n"
                  << "  --index FILE    entry file required in the root (default: index.html)\n"
                  << "  --no-open       do not open the browser\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << app << "\n"
                  << "  " << app << " serve ./public --port 3000 --no-open\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    const std::string command = argc >= 2 ? argv[1] : "serve";
    const devserve::Context ctx(true);

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << devserve::kAppName << " " << devserve::kVersion << '\n';
        return 0;
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec)
    {
        ctx.error("Cannot determine the current directory: ", ec.message());
        return 1;
    }

    // "serve" is the only command and may be omitted.
    const int firstArg = command == "serve" ? 2 : 1;
    return devserve::commands::runServeCommand(ctx, cwd, collectArgs(argc, argv, firstArg));
}
