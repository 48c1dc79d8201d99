#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace minimcp
{

using Json = nlohmann::json;

/// Server identity reported by get_server_info. Fixed once the server is constructed.
struct ServerInfo
{
    std::string name;
    std::string version;
};

/// Capabilities advertised when none are supplied: tools and resources, each
/// with an empty descriptor.
inline Json default_capabilities()
{
    return Json{{"tools", Json::object()}, {"resources", Json::object()}};
}

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    info.version = j.at("version").get<std::string>();
}

} // namespace minimcp
