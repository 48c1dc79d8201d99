#pragma once
#include "minimcp/protocol/jsonrpc.hpp"
#include "minimcp/server/registry.hpp"

#include <exception>
#include <functional>
#include <string>

namespace minimcp::mcp
{

/// Routes decoded requests to the registry's handlers and turns the outcome
/// into a response envelope:
/// - unknown method     -> MethodNotFound "Method not found: <method>"
/// - McpError thrown    -> forwarded with its code, message and data
/// - anything else thrown -> error observer called once, then
///                         InternalError "Internal error: <what>"
///                         ("unknown exception" for non-std types)
class Dispatcher
{
  public:
    using ErrorObserver = std::function<void(const std::exception&)>;

    explicit Dispatcher(const server::Registry& registry, ErrorObserver on_error = {})
        : registry_(registry), on_error_(std::move(on_error))
    {
    }

    protocol::Response dispatch(const protocol::Request& request) const;

    /// Decode one line, dispatch it, encode the reply. Lines that fail to
    /// decode get their ParseError / InvalidRequest reply without reaching
    /// a handler.
    std::string handle_line(const std::string& line) const;

    void set_error_observer(ErrorObserver on_error)
    {
        on_error_ = std::move(on_error);
    }

  private:
    void notify(const std::exception& error) const;

    const server::Registry& registry_;
    ErrorObserver on_error_;
};

/// Line handler for StdioServerWrapper backed by a dispatcher.
/// The dispatcher must outlive the returned function.
std::function<std::string(const std::string&)> make_line_handler(const Dispatcher& dispatcher);

} // namespace minimcp::mcp
