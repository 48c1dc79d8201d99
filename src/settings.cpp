#include "minimcp/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace minimcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MINIMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    auto file = getenv_str("MINIMCP_LOG_FILE", "");
    if (!file.empty())
        s.log_file = file;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("log_file") && !j.at("log_file").is_null())
        s.log_file = j.at("log_file").get<std::string>();
    return s;
}

} // namespace minimcp
