#pragma once
#include "minimcp/types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace minimcp::resources
{

/// Placeholder extracted from a URI template
struct TemplateParameter
{
    std::string name;
    bool is_wildcard{false}; // {var*} vs {var}
};

/// Parameterized resource, e.g. "weather://{city}/current".
/// Supported placeholders:
///   - {var}  - matches one path segment, [^/?#]+
///   - {var*} - matches the remainder, .+
struct ResourceTemplate
{
    std::string uri_template;
    std::string name;
    std::optional<std::string> mime_type;
    std::optional<std::string> description;

    // Populated by parse()
    std::vector<TemplateParameter> parsed_params;
    std::regex uri_regex;

    /// Parse the URI template and build the matching regex.
    /// Throws std::invalid_argument on an unterminated or empty placeholder.
    void parse();

    /// Match a concrete URI. Returns nullopt if it does not fit the template,
    /// otherwise placeholder name -> URL-decoded value.
    std::optional<std::unordered_map<std::string, std::string>> match(const std::string& uri) const;

    /// Replace every placeholder with the given value.
    std::string expand(const std::unordered_map<std::string, std::string>& values) const;
};

/// Extract placeholder names in template order: {var}, {var*}
std::vector<std::string> extract_params(const std::string& uri_template);

/// Build regex pattern from URI template
std::string build_regex_pattern(const std::string& uri_template);

/// URL-decode a string ('+' decodes to a space)
std::string url_decode(const std::string& encoded);

/// URL-encode a string
std::string url_encode(const std::string& decoded);

// nlohmann::json adapters
inline void to_json(Json& j, const ResourceTemplate& t)
{
    j = Json{{"uri_template", t.uri_template}, {"name", t.name}};
    if (t.mime_type)
        j["mime_type"] = *t.mime_type;
    if (t.description)
        j["description"] = *t.description;
}

} // namespace minimcp::resources
