#pragma once

#include <cstddef>
#include <iostream>
#include <string>

namespace devserve {

class Context {
public:
    explicit Context(bool verbose = true) : out_(&std::cout), verbose_(verbose) {}
    explicit Context(std::ostream &out, bool verbose = true) : out_(&out), verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        (*out_ << ... << args) << '\n';
        out_->flush();
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        *out_ << "[warn] ";
        (*out_ << ... << args) << '\n';
        out_->flush();
    }

    template <typename... Args>
    void error(const Args &...args) const {
        *out_ << "[error] ";
        (*out_ << ... << args) << '\n';
        out_->flush();
    }

    // [19/Oct/2026 20:05:11] "GET / HTTP/1.1" 200 1043
    void access(const std::string &requestLine, int status, std::size_t bodySize) const;

    bool verbose() const { return verbose_; }

private:
    std::ostream *out_;
    bool verbose_;
};

std::string accessTimestamp();

} // namespace devserve
