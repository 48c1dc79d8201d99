#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace minimcp
{

using Json = nlohmann::json;

/// Ordered content items returned by tools and resource readers.
using ContentList = std::vector<Json>;

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Content item produced by read_resource.
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ResourceContent& c)
{
    j = Json{{"uri", c.uri}};
    if (c.mime_type)
        j["mime_type"] = *c.mime_type;
    j["text"] = c.text;
}

inline Json text_content(std::string text)
{
    return TextContent{"text", std::move(text)};
}

} // namespace minimcp
