#include "minimcp/server/stdio_server.hpp"

#include "minimcp/log.hpp"

#include <string>

namespace minimcp::server
{

StdioServerWrapper::StdioServerWrapper(LineHandler handler, std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        out_ << handler_(line) << '\n';
        out_.flush();
    }

    if (!stop_requested_)
        log::logger()->debug("input stream closed");
    running_ = false;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    run_loop();

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;
}

} // namespace minimcp::server
