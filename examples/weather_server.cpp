#include <minimcp.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>

// Example: Weather MCP server
//
// Tools:      get_forecast, get_current_weather
// Resources:  weather://Tokyo/current
// Templates:  weather://{city}/current
//
// Weather data is generated locally; the tools still refuse to run unless
// OPENWEATHER_API_KEY is set, mirroring a deployment backed by the real API.
//
// Usage:
//   OPENWEATHER_API_KEY=... ./minimcp_weather
//   {"jsonrpc":"2.0","id":1,"method":"read_resource","params":{"uri":"weather://Paris/current"}}

namespace
{

using minimcp::Json;

const char* const CONDITIONS[] = {"Sunny", "Cloudy", "Rainy", "Snowy"};

void on_interrupt(int)
{
    static const char msg[] = "Shutting down minimcp weather server...\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    std::_Exit(0);
}

std::mt19937& rng()
{
    static std::mt19937 gen{std::random_device{}()};
    return gen;
}

int random_between(int lo, int hi)
{
    return std::uniform_int_distribution<int>(lo, hi)(rng());
}

std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

Json mock_current_weather(const std::string& city)
{
    return Json{{"city", city},
                {"temperature", random_between(0, 30)},
                {"conditions", CONDITIONS[random_between(0, 3)]},
                {"humidity", random_between(30, 90)},
                {"wind_speed", random_between(0, 30)},
                {"timestamp", format_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ")}};
}

Json mock_forecast(const std::string& city, int days)
{
    Json out = Json::array();
    auto now = std::chrono::system_clock::now();
    for (int day = 1; day <= days; ++day)
    {
        out.push_back(Json{{"city", city},
                           {"date", format_time(now + std::chrono::hours(24 * day), "%Y-%m-%d")},
                           {"temperature",
                            {{"min", random_between(-5, 25)}, {"max", random_between(0, 35)}}},
                           {"conditions", CONDITIONS[random_between(0, 3)]},
                           {"humidity", random_between(30, 90)},
                           {"wind_speed", random_between(0, 30)}});
    }
    return out;
}

bool has_api_key()
{
    const char* key = std::getenv("OPENWEATHER_API_KEY");
    return key && *key;
}

minimcp::ContentList missing_api_key()
{
    return {Json{{"type", "text"},
                 {"text", "Error: OPENWEATHER_API_KEY environment variable is not set"},
                 {"is_error", true}}};
}

std::string required_city(const Json& args)
{
    if (!args.contains("city") || !args["city"].is_string())
        throw minimcp::InvalidParamsError("Missing required argument: city");
    return args["city"].get<std::string>();
}

} // namespace

int main()
{
    std::signal(SIGINT, on_interrupt);

    minimcp::server::Server server({"minimcp-weather", "0.1.0"});

    server.register_tool(
        "get_forecast", "Get weather forecast for a city",
        Json{{"type", "object"},
             {"properties",
              {{"city", {{"type", "string"}, {"description", "City name"}}},
               {"days",
                {{"type", "number"},
                 {"description", "Number of days (1-5)"},
                 {"minimum", 1},
                 {"maximum", 5}}}}},
             {"required", Json::array({"city"})}},
        [](const Json& args) -> minimcp::ContentList
        {
            std::string city = required_city(args);
            if (!has_api_key())
                return missing_api_key();

            int days = 3;
            if (args.contains("days") && args["days"].is_number())
                days = args["days"].get<int>();
            if (days < 1 || days > 5)
                throw minimcp::InvalidParamsError("days must be between 1 and 5");

            return {minimcp::text_content(mock_forecast(city, days).dump(2))};
        });

    server.register_tool(
        "get_current_weather", "Get current weather for a city",
        Json{{"type", "object"},
             {"properties", {{"city", {{"type", "string"}, {"description", "City name"}}}}},
             {"required", Json::array({"city"})}},
        [](const Json& args) -> minimcp::ContentList
        {
            std::string city = required_city(args);
            if (!has_api_key())
                return missing_api_key();
            return {minimcp::text_content(mock_current_weather(city).dump(2))};
        });

    server.register_resource("weather://Tokyo/current", "Current weather in Tokyo",
                             "application/json", "Real-time weather data for Tokyo");
    server.register_resource_template("weather://{city}/current",
                                      "Current weather for a given city", "application/json",
                                      "Real-time weather data for a specified city");

    const auto& resources = server.registry().resources();
    server.set_resource_reader(
        [&resources](const std::string& uri) -> minimcp::ContentList
        {
            auto matched = resources.match_template(uri);
            if (!matched || matched->second.count("city") == 0)
                throw minimcp::InvalidRequestError("Invalid URI format: " + uri);

            const std::string& city = matched->second.at("city");
            minimcp::ResourceContent content{uri, std::string("application/json"),
                                             mock_current_weather(city).dump(2)};
            return {Json(content)};
        });

    server.run();
    return 0;
}
