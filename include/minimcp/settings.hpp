#pragma once
#include "minimcp/types.hpp"

#include <optional>
#include <string>

namespace minimcp
{

struct Settings
{
    std::string log_level{"INFO"};
    std::optional<std::string> log_file;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace minimcp
