#include "io/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devserve::io {
namespace {

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

bool isExecutableFile(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

bool setCloseOnExec(int fd) {
    const int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

// Child side only: hands errno to the parent and exits.
[[noreturn]] void reportChildFailure(int fd, int code) {
    const ssize_t written = write(fd, &code, sizeof(code));
    (void)written;
    _exit(127);
}

void redirectStdioToNull() {
    const int devNull = open("/dev/null", O_RDWR);
    if (devNull < 0) {
        return;
    }
    dup2(devNull, STDIN_FILENO);
    dup2(devNull, STDOUT_FILENO);
    dup2(devNull, STDERR_FILENO);
    if (devNull > STDERR_FILENO) {
        close(devNull);
    }
}

} // namespace

std::string shellQuote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

bool launchDetached(const std::string &command, const std::vector<std::string> &args, std::string &err) {
    const std::string display = buildDisplayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    // The write end closes on a successful exec; anything read back is the
    // errno of the step that failed.
    int status[2];
    if (pipe(status) != 0) {
        err = "cannot create status pipe for " + display + ": " + std::strerror(errno);
        return false;
    }
    if (!setCloseOnExec(status[0]) || !setCloseOnExec(status[1])) {
        err = "cannot configure status pipe for " + display + ": " + std::strerror(errno);
        close(status[0]);
        close(status[1]);
        return false;
    }

    // Double fork: the launcher exits at once, the grandchild is reparented
    // to init and never becomes a zombie of the server.
    const pid_t launcher = fork();
    if (launcher < 0) {
        err = "cannot fork launcher for " + display + ": " + std::strerror(errno);
        close(status[0]);
        close(status[1]);
        return false;
    }

    if (launcher == 0) {
        close(status[0]);
        if (setsid() < 0) {
            reportChildFailure(status[1], errno);
        }
        const pid_t daemon = fork();
        if (daemon < 0) {
            reportChildFailure(status[1], errno);
        }
        if (daemon > 0) {
            _exit(0);
        }

        redirectStdioToNull();
        execvp(command.c_str(), argv.data());
        reportChildFailure(status[1], errno);
    }

    close(status[1]);

    int launcherStatus = 0;
    while (waitpid(launcher, &launcherStatus, 0) < 0) {
        if (errno != EINTR) {
            err = "cannot wait for launcher of " + display + ": " + std::strerror(errno);
            close(status[0]);
            return false;
        }
    }

    int childErrno = 0;
    ssize_t got = 0;
    do {
        got = read(status[0], &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    close(status[0]);

    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        err = display + ": " + std::strerror(childErrno);
        return false;
    }
    if (!WIFEXITED(launcherStatus) || WEXITSTATUS(launcherStatus) != 0) {
        err = "launcher for " + display + " ended abnormally";
        return false;
    }
    return true;
}

std::optional<std::filesystem::path> findExecutable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    const char *pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }

    std::istringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace devserve::io
