#pragma once
#include "minimcp/content.hpp"
#include "minimcp/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace minimcp::resources
{

/// Exact, non-templated resource. Declarative only: content comes from the
/// registry's single resource reader.
struct Resource
{
    std::string uri;                        // e.g., "weather://Tokyo/current"
    std::string name;                       // Human-readable name
    std::optional<std::string> mime_type;   // MIME type hint
    std::optional<std::string> description; // Optional description
};

/// Resolves any resource URI (exact or template-matched) to its content items.
using Reader = std::function<ContentList(const std::string& uri)>;

// nlohmann::json adapters
inline void to_json(Json& j, const Resource& r)
{
    j = Json{{"uri", r.uri}, {"name", r.name}};
    if (r.mime_type)
        j["mime_type"] = *r.mime_type;
    if (r.description)
        j["description"] = *r.description;
}

} // namespace minimcp::resources
