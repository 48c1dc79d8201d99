#pragma once
#include "minimcp/resources/manager.hpp"
#include "minimcp/tools/manager.hpp"
#include "minimcp/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace minimcp::server
{

/// Owns every method handler and every tool, resource, template and reader.
///
/// Registering a tool (re)installs `list_tools` and `call_tool`; a resource,
/// `list_resources`; a template, `list_resource_templates`; a reader,
/// `read_resource`. Those handlers read the live collections, so their
/// results always match the current registry contents, in registration order.
/// An introspection method does not exist until the first entry of its kind
/// is registered.
///
/// Installed handlers capture `this`; the registry is neither copyable nor movable.
class Registry
{
  public:
    /// Receives the request params (always an object), returns the result.
    /// Throw McpError to report a protocol error.
    using Handler = std::function<Json(const Json& params)>;

    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Install or replace the handler for a method. Throws std::invalid_argument
    /// for an empty method name.
    void register_handler(const std::string& method, Handler handler);

    void register_tool(std::string name, std::string description, Json input_schema,
                       tools::Tool::Fn fn);
    void register_tool(tools::Tool tool);

    void register_resource(std::string uri, std::string name,
                           std::optional<std::string> mime_type = std::nullopt,
                           std::optional<std::string> description = std::nullopt);
    void register_resource(resources::Resource resource);

    /// Throws std::invalid_argument for a malformed template.
    void register_resource_template(std::string uri_template, std::string name,
                                    std::optional<std::string> mime_type = std::nullopt,
                                    std::optional<std::string> description = std::nullopt);
    void register_resource_template(resources::ResourceTemplate templ);

    /// Install the single reader used for every read_resource call. Last one wins.
    void set_resource_reader(resources::Reader reader);

    /// nullptr when no handler is registered for the method
    const Handler* find_handler(const std::string& method) const;
    bool has_handler(const std::string& method) const
    {
        return find_handler(method) != nullptr;
    }
    std::vector<std::string> methods() const;

    const tools::ToolManager& tools() const
    {
        return tools_;
    }
    const resources::ResourceManager& resources() const
    {
        return resources_;
    }

  private:
    void install_tool_handlers();
    void install_resource_handlers();
    void install_template_handlers();

    std::unordered_map<std::string, Handler> routes_;
    tools::ToolManager tools_;
    resources::ResourceManager resources_;
    resources::Reader reader_;
};

} // namespace minimcp::server
