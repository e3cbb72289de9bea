#include "io/browser.hpp"

#include <cstdlib>

#include "io/process.hpp"

namespace devserve::io
{

    std::string browserCommand()
    {
        const char *fromEnv = std::getenv("BROWSER");
        if (fromEnv != nullptr && fromEnv[0] != '\0')
        {
            // $BROWSER may list several commands separated by ':'; the first one wins.
            std::string value(fromEnv);
            const std::size_t sep = value.find(':');
            return sep == std::string::npos ? value : value.substr(0, sep);
        }
#ifdef __APPLE__
        return "open";
#else
        return "xdg-open";
#endif
    }

    bool openBrowser(const std::string &url, std::string &err)
    {
        const std::string command = browserCommand();
        if (!findExecutable(command).has_value())
        {
            err = "browser command not found: " + command;
            return false;
        }
        return launchDetached(command, {url}, err);
    }

} // namespace devserve::io
