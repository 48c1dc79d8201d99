#pragma once
#include "minimcp/exceptions.hpp"
#include "minimcp/resources/resource.hpp"
#include "minimcp/resources/template.hpp"

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace minimcp::resources
{

/// Resource and template descriptors, each keyed by URI / URI template and
/// listed in first-registration order. Re-registration replaces in place.
class ResourceManager
{
  public:
    void register_resource(Resource res)
    {
        auto it = by_uri_.find(res.uri);
        if (it != by_uri_.end())
        {
            resources_[it->second] = std::move(res);
            return;
        }
        by_uri_.emplace(res.uri, resources_.size());
        resources_.push_back(std::move(res));
    }

    void register_template(ResourceTemplate templ)
    {
        templ.parse();
        auto it = by_template_.find(templ.uri_template);
        if (it != by_template_.end())
        {
            templates_[it->second] = std::move(templ);
            return;
        }
        by_template_.emplace(templ.uri_template, templates_.size());
        templates_.push_back(std::move(templ));
    }

    bool has(const std::string& uri) const
    {
        return by_uri_.count(uri) > 0;
    }

    const Resource& get(const std::string& uri) const
    {
        auto it = by_uri_.find(uri);
        if (it == by_uri_.end())
            throw InvalidParamsError("Resource not found: " + uri);
        return resources_[it->second];
    }

    const std::vector<Resource>& list() const
    {
        return resources_;
    }

    const std::vector<ResourceTemplate>& list_templates() const
    {
        return templates_;
    }

    /// First template (in registration order) matching the URI, with its extracted values
    std::optional<std::pair<const ResourceTemplate*, std::unordered_map<std::string, std::string>>>
    match_template(const std::string& uri) const
    {
        for (const auto& templ : templates_)
        {
            auto params = templ.match(uri);
            if (params)
                return std::make_pair(&templ, *params);
        }
        return std::nullopt;
    }

  private:
    std::vector<Resource> resources_;
    std::unordered_map<std::string, std::size_t> by_uri_;
    std::vector<ResourceTemplate> templates_;
    std::unordered_map<std::string, std::size_t> by_template_;
};

} // namespace minimcp::resources
