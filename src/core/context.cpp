#include "core/context.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace devserve
{

    std::string accessTimestamp()
    {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%d/%b/%Y %H:%M:%S");
        return out.str();
    }

    void Context::access(const std::string &requestLine, int status, std::size_t bodySize) const
    {
        if (!verbose_)
        {
            return;
        }

        *out_ << '[' << accessTimestamp() << "] \"" << requestLine << "\" " << status << ' ';
        if (bodySize == 0)
        {
            *out_ << '-';
        }
        else
        {
            *out_ << bodySize;
        }
        *out_ << '\n';
        out_->flush();
    }

} // namespace devserve
