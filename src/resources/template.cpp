#include "minimcp/resources/template.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace minimcp::resources
{

namespace
{
struct Placeholder
{
    std::size_t begin; // position of '{'
    std::size_t end;   // one past '}'
    std::string name;
    bool is_wildcard;
};

std::vector<Placeholder> scan_placeholders(const std::string& uri_template)
{
    std::vector<Placeholder> out;
    std::size_t pos = 0;
    while ((pos = uri_template.find('{', pos)) != std::string::npos)
    {
        std::size_t close = uri_template.find('}', pos);
        if (close == std::string::npos)
            throw std::invalid_argument("Unterminated placeholder in URI template: " +
                                        uri_template);

        std::string name = uri_template.substr(pos + 1, close - pos - 1);
        bool wildcard = !name.empty() && name.back() == '*';
        if (wildcard)
            name.pop_back();
        if (name.empty())
            throw std::invalid_argument("Empty placeholder in URI template: " + uri_template);

        out.push_back(Placeholder{pos, close + 1, std::move(name), wildcard});
        pos = close + 1;
    }
    return out;
}

// Escape special regex characters
std::string escape_regex(const std::string& str)
{
    static const std::regex special_chars(R"([.^$|()[\]{}*+?\\])");
    return std::regex_replace(str, special_chars, R"(\$&)");
}
} // namespace

// URL-decode a string (RFC 3986, form-style '+')
std::string url_decode(const std::string& encoded)
{
    std::string result;
    result.reserve(encoded.size());

    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2])))
        {
            char hex[3] = {encoded[i + 1], encoded[i + 2], '\0'};
            char* end = nullptr;
            long value = std::strtol(hex, &end, 16);
            if (end == hex + 2)
            {
                result += static_cast<char>(value);
                i += 2;
                continue;
            }
        }
        else if (encoded[i] == '+')
        {
            result += ' ';
            continue;
        }
        result += encoded[i];
    }

    return result;
}

std::string url_encode(const std::string& decoded)
{
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (unsigned char c : decoded)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            encoded << c;
        else
            encoded << '%' << std::uppercase << std::setw(2) << static_cast<int>(c);
    }

    return encoded.str();
}

std::vector<std::string> extract_params(const std::string& uri_template)
{
    std::vector<std::string> names;
    for (const auto& p : scan_placeholders(uri_template))
        names.push_back(p.name);
    return names;
}

std::string build_regex_pattern(const std::string& uri_template)
{
    std::string result;
    std::size_t pos = 0;

    for (const auto& p : scan_placeholders(uri_template))
    {
        if (p.begin > pos)
            result += escape_regex(uri_template.substr(pos, p.begin - pos));
        result += p.is_wildcard ? "(.+)" : "([^/?#]+)";
        pos = p.end;
    }
    if (pos < uri_template.size())
        result += escape_regex(uri_template.substr(pos));

    return "^" + result + "$";
}

void ResourceTemplate::parse()
{
    parsed_params.clear();
    for (const auto& p : scan_placeholders(uri_template))
        parsed_params.push_back(TemplateParameter{p.name, p.is_wildcard});

    try
    {
        uri_regex = std::regex(build_regex_pattern(uri_template), std::regex::ECMAScript);
    }
    catch (const std::regex_error& e)
    {
        throw std::invalid_argument("Failed to compile URI template regex: " +
                                    std::string(e.what()));
    }
}

std::optional<std::unordered_map<std::string, std::string>>
ResourceTemplate::match(const std::string& uri) const
{
    std::smatch match;
    if (!std::regex_match(uri, match, uri_regex))
        return std::nullopt;

    // Capture groups follow placeholder order
    std::unordered_map<std::string, std::string> params;
    for (std::size_t i = 0; i < parsed_params.size() && i + 1 < match.size(); ++i)
        params[parsed_params[i].name] = url_decode(match[i + 1].str());
    return params;
}

std::string
ResourceTemplate::expand(const std::unordered_map<std::string, std::string>& values) const
{
    std::string out;
    std::size_t pos = 0;
    for (const auto& p : scan_placeholders(uri_template))
    {
        out += uri_template.substr(pos, p.begin - pos);
        auto it = values.find(p.name);
        if (it != values.end())
            out += p.is_wildcard ? it->second : url_encode(it->second);
        pos = p.end;
    }
    out += uri_template.substr(pos);
    return out;
}

} // namespace minimcp::resources
