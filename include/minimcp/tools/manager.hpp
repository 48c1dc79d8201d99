#pragma once
#include "minimcp/exceptions.hpp"
#include "minimcp/tools/tool.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace minimcp::tools
{

/// Tools keyed by name, listed in first-registration order.
/// Registering an existing name replaces the tool in place.
class ToolManager
{
  public:
    void register_tool(Tool t)
    {
        auto it = index_.find(t.name());
        if (it != index_.end())
        {
            tools_[it->second] = std::move(t);
            return;
        }
        index_.emplace(t.name(), tools_.size());
        tools_.push_back(std::move(t));
    }

    bool has(const std::string& name) const
    {
        return index_.count(name) > 0;
    }

    const Tool& get(const std::string& name) const
    {
        auto it = index_.find(name);
        if (it == index_.end())
            throw MethodNotFoundError("Unknown tool: " + name);
        return tools_[it->second];
    }

    ContentList invoke(const std::string& name, const Json& arguments) const
    {
        return get(name).invoke(arguments);
    }

    const std::vector<Tool>& list() const
    {
        return tools_;
    }

    std::vector<std::string> list_names() const
    {
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& t : tools_)
            names.push_back(t.name());
        return names;
    }

    std::size_t size() const
    {
        return tools_.size();
    }

  private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace minimcp::tools
