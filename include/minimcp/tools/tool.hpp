#pragma once
#include "minimcp/content.hpp"
#include "minimcp/types.hpp"

#include <functional>
#include <string>

namespace minimcp::tools
{

class Tool
{
  public:
    /// Receives the call's argument object, returns the content items in order.
    using Fn = std::function<ContentList(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    ContentList invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

    /// Listing entry. The handler itself is never exposed.
    Json descriptor() const
    {
        return Json{{"name", name_}, {"description", description_}, {"input_schema", input_schema_}};
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

} // namespace minimcp::tools
