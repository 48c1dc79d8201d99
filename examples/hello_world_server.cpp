#include <minimcp.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <unistd.h>

// Example: Hello World MCP server
//
// Exposes two tools over stdin/stdout:
//   hello_world  - greets someone in one of several languages
//   get_time     - reports the current time
//
// Usage:
//   ./minimcp_hello_world
//
// Then send requests via stdin, for example:
//   {"jsonrpc":"2.0","id":1,"method":"get_server_info"}
//   {"jsonrpc":"2.0","id":2,"method":"list_tools"}
//   {"jsonrpc":"2.0","id":3,"method":"call_tool","params":{"name":"hello_world","arguments":{"name":"Ada","language":"fr"}}}
//
// Press Ctrl+D to send EOF and terminate.

namespace
{

using minimcp::Json;

void on_interrupt(int)
{
    static const char msg[] = "Shutting down minimcp hello world server...\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    std::_Exit(0);
}

std::string greeting(const std::string& name, const std::string& language)
{
    if (language == "es")
        return "¡Hola, " + name + "!";
    if (language == "fr")
        return "Bonjour, " + name + "!";
    if (language == "de")
        return "Hallo, " + name + "!";
    if (language == "ja")
        return "こんにちは、" + name + "さん!";
    return "Hello, " + name + "!";
}

std::string utc_now()
{
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

} // namespace

int main()
{
    std::signal(SIGINT, on_interrupt);

    minimcp::server::Server server({"minimcp-hello-world", "0.1.0"});

    server.register_tool(
        "hello_world", "Say hello to someone",
        Json{{"type", "object"},
             {"properties",
              {{"name", {{"type", "string"}, {"description", "Name to greet"}}},
               {"language",
                {{"type", "string"},
                 {"description", "Language to use for greeting"},
                 {"enum", Json::array({"en", "es", "fr", "de", "ja"})}}}}},
             {"required", Json::array({"name"})}},
        [](const Json& args)
        {
            if (!args.contains("name") || !args["name"].is_string())
                throw minimcp::InvalidParamsError("Missing required argument: name");
            std::string language = args.value("language", std::string("en"));
            return minimcp::ContentList{
                minimcp::text_content(greeting(args["name"].get<std::string>(), language))};
        });

    server.register_tool(
        "get_time", "Get the current time",
        Json{{"type", "object"},
             {"properties",
              {{"timezone",
                {{"type", "string"}, {"description", "Timezone (e.g., UTC, JST, PST)"}}}}}},
        [](const Json& args)
        {
            // Timezone is echoed back only; the clock is always reported in UTC
            std::string timezone = args.value("timezone", std::string("UTC"));
            return minimcp::ContentList{
                minimcp::text_content("Current time (" + timezone + "): " + utc_now())};
        });

    server.run();
    return 0;
}
