#include "minimcp/server/registry.hpp"

#include "minimcp/exceptions.hpp"

#include <algorithm>
#include <stdexcept>

namespace minimcp::server
{

namespace
{
std::string string_param(const Json& params, const char* key)
{
    auto it = params.find(key);
    if (it == params.end() || !it->is_string())
        return std::string{};
    return it->get<std::string>();
}

Json to_array(const ContentList& items)
{
    Json out = Json::array();
    for (const auto& item : items)
        out.push_back(item);
    return out;
}
} // namespace

void Registry::register_handler(const std::string& method, Handler handler)
{
    if (method.empty())
        throw std::invalid_argument("method name must not be empty");
    if (!handler)
        throw std::invalid_argument("handler for '" + method + "' must not be empty");
    routes_[method] = std::move(handler);
}

void Registry::register_tool(std::string name, std::string description, Json input_schema,
                             tools::Tool::Fn fn)
{
    register_tool(
        tools::Tool(std::move(name), std::move(description), std::move(input_schema), std::move(fn)));
}

void Registry::register_tool(tools::Tool tool)
{
    if (tool.name().empty())
        throw std::invalid_argument("tool name must not be empty");
    tools_.register_tool(std::move(tool));
    install_tool_handlers();
}

void Registry::register_resource(std::string uri, std::string name,
                                 std::optional<std::string> mime_type,
                                 std::optional<std::string> description)
{
    register_resource(resources::Resource{std::move(uri), std::move(name), std::move(mime_type),
                                          std::move(description)});
}

void Registry::register_resource(resources::Resource resource)
{
    if (resource.uri.empty())
        throw std::invalid_argument("resource uri must not be empty");
    resources_.register_resource(std::move(resource));
    install_resource_handlers();
}

void Registry::register_resource_template(std::string uri_template, std::string name,
                                          std::optional<std::string> mime_type,
                                          std::optional<std::string> description)
{
    resources::ResourceTemplate templ;
    templ.uri_template = std::move(uri_template);
    templ.name = std::move(name);
    templ.mime_type = std::move(mime_type);
    templ.description = std::move(description);
    register_resource_template(std::move(templ));
}

void Registry::register_resource_template(resources::ResourceTemplate templ)
{
    if (templ.uri_template.empty())
        throw std::invalid_argument("resource template must not be empty");
    resources_.register_template(std::move(templ));
    install_template_handlers();
}

void Registry::set_resource_reader(resources::Reader reader)
{
    if (!reader)
        throw std::invalid_argument("resource reader must not be empty");
    reader_ = std::move(reader);

    register_handler("read_resource",
                     [this](const Json& params) -> Json
                     {
                         auto it = params.find("uri");
                         if (it == params.end() || !it->is_string())
                             throw InvalidParamsError("Missing required parameter: uri");
                         // Copy: the reader may replace itself while running
                         resources::Reader reader = reader_;
                         return Json{{"contents", to_array(reader(it->get<std::string>()))}};
                     });
}

const Registry::Handler* Registry::find_handler(const std::string& method) const
{
    auto it = routes_.find(method);
    if (it == routes_.end())
        return nullptr;
    return &it->second;
}

std::vector<std::string> Registry::methods() const
{
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& kv : routes_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

void Registry::install_tool_handlers()
{
    register_handler("list_tools",
                     [this](const Json&) -> Json
                     {
                         Json tools = Json::array();
                         for (const auto& t : tools_.list())
                             tools.push_back(t.descriptor());
                         return Json{{"tools", tools}};
                     });

    register_handler("call_tool",
                     [this](const Json& params) -> Json
                     {
                         std::string name = string_param(params, "name");
                         if (!tools_.has(name))
                             throw MethodNotFoundError("Unknown tool: " + name);

                         Json arguments = Json::object();
                         auto it = params.find("arguments");
                         if (it != params.end() && !it->is_null())
                             arguments = *it;
                         // Copy: the tool may register tools while running
                         tools::Tool tool = tools_.get(name);
                         return Json{{"content", to_array(tool.invoke(arguments))}};
                     });
}

void Registry::install_resource_handlers()
{
    register_handler("list_resources",
                     [this](const Json&) -> Json
                     {
                         Json list = Json::array();
                         for (const auto& r : resources_.list())
                             list.push_back(Json(r));
                         return Json{{"resources", list}};
                     });
}

void Registry::install_template_handlers()
{
    register_handler("list_resource_templates",
                     [this](const Json&) -> Json
                     {
                         Json list = Json::array();
                         for (const auto& t : resources_.list_templates())
                             list.push_back(Json(t));
                         return Json{{"resource_templates", list}};
                     });
}

} // namespace minimcp::server
