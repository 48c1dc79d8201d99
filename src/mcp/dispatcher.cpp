#include "minimcp/mcp/dispatcher.hpp"

#include "minimcp/exceptions.hpp"
#include "minimcp/log.hpp"

#include <stdexcept>

namespace minimcp::mcp
{

protocol::Response Dispatcher::dispatch(const protocol::Request& request) const
{
    const server::Registry::Handler* found = registry_.find_handler(request.method);
    if (!found)
    {
        log::logger()->debug("unknown method '{}'", request.method);
        return protocol::Response::failure(
            request.id, MethodNotFoundError("Method not found: " + request.method));
    }

    // Invoke a copy: a handler may re-register its own method while running
    server::Registry::Handler handler = *found;
    try
    {
        return protocol::Response::success(request.id, handler(request.params));
    }
    catch (const McpError& e)
    {
        log::logger()->debug("{} failed: {} ({})", request.method, e.what(), e.code_value());
        return protocol::Response::failure(request.id, e);
    }
    catch (const std::exception& e)
    {
        notify(e);
        return protocol::Response::failure(
            request.id, InternalError(std::string("Internal error: ") + e.what()));
    }
    catch (...)
    {
        notify(std::runtime_error("unknown exception"));
        return protocol::Response::failure(request.id,
                                           InternalError("Internal error: unknown exception"));
    }
}

void Dispatcher::notify(const std::exception& error) const
{
    if (!on_error_)
        return;
    // The reply must still go out when the host's observer fails
    try
    {
        on_error_(error);
    }
    catch (const std::exception& e)
    {
        log::logger()->warn("error observer threw: {}", e.what());
    }
    catch (...)
    {
        log::logger()->warn("error observer threw a non-standard exception");
    }
}

std::string Dispatcher::handle_line(const std::string& line) const
{
    protocol::Request request;
    try
    {
        request = protocol::decode_request(line);
    }
    catch (const McpError& e)
    {
        log::logger()->debug("rejected input line: {}", e.what());
        return protocol::encode_response(
            protocol::Response::failure(protocol::recover_id(line), e));
    }

    log::logger()->trace("dispatching {}", request.method);
    return protocol::encode_response(dispatch(request));
}

std::function<std::string(const std::string&)> make_line_handler(const Dispatcher& dispatcher)
{
    return [&dispatcher](const std::string& line) { return dispatcher.handle_line(line); };
}

} // namespace minimcp::mcp
