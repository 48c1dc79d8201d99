#pragma once
#include "minimcp/mcp/dispatcher.hpp"
#include "minimcp/server/registry.hpp"
#include "minimcp/server/stdio_server.hpp"
#include "minimcp/types.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace minimcp::server
{

/// MCP server - bundles server metadata with the registry, the dispatcher and
/// the line loop.
///
/// Construction installs `get_server_info`, which reports
/// {name, version, capabilities}. The default error observer logs unexpected
/// handler failures at error level.
///
/// Usage:
/// ```cpp
/// Server server({"hello", "0.1.0"});
/// server.register_tool("echo", "Echo text", schema,
///                      [](const Json& args) { return ContentList{text_content(args.at("text"))}; });
/// server.run();  // stdin -> stdout until EOF
/// ```
class Server
{
  public:
    using ErrorObserver = mcp::Dispatcher::ErrorObserver;

    explicit Server(ServerInfo info, Json capabilities = default_capabilities());
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    const ServerInfo& info() const
    {
        return info_;
    }
    const Json& capabilities() const
    {
        return capabilities_;
    }

    Registry& registry()
    {
        return registry_;
    }
    const Registry& registry() const
    {
        return registry_;
    }

    // Registration shortcuts, see Registry
    void register_handler(const std::string& method, Registry::Handler handler)
    {
        registry_.register_handler(method, std::move(handler));
    }
    void register_tool(std::string name, std::string description, Json input_schema,
                       tools::Tool::Fn fn)
    {
        registry_.register_tool(std::move(name), std::move(description), std::move(input_schema),
                                std::move(fn));
    }
    void register_resource(std::string uri, std::string name,
                           std::optional<std::string> mime_type = std::nullopt,
                           std::optional<std::string> description = std::nullopt)
    {
        registry_.register_resource(std::move(uri), std::move(name), std::move(mime_type),
                                    std::move(description));
    }
    void register_resource_template(std::string uri_template, std::string name,
                                    std::optional<std::string> mime_type = std::nullopt,
                                    std::optional<std::string> description = std::nullopt)
    {
        registry_.register_resource_template(std::move(uri_template), std::move(name),
                                             std::move(mime_type), std::move(description));
    }
    void set_resource_reader(resources::Reader reader)
    {
        registry_.set_resource_reader(std::move(reader));
    }

    /// Replace the observer notified of unexpected handler failures.
    void set_error_observer(ErrorObserver on_error)
    {
        dispatcher_.set_error_observer(std::move(on_error));
    }

    protocol::Response handle(const protocol::Request& request) const
    {
        return dispatcher_.dispatch(request);
    }
    std::string handle_line(const std::string& line) const
    {
        return dispatcher_.handle_line(line);
    }

    /// Serve requests from `in` to `out` until end of input or stop().
    /// Returns false if the server is already running.
    bool run(std::istream& in = std::cin, std::ostream& out = std::cout);

    /// Ask a running loop to exit before it reads the next line.
    void stop();

  private:
    ServerInfo info_;
    Json capabilities_;
    Registry registry_;
    mcp::Dispatcher dispatcher_;
    StdioServerWrapper* loop_{nullptr};
};

} // namespace minimcp::server
