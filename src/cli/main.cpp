#include "minimcp/log.hpp"
#include "minimcp/protocol/jsonrpc.hpp"
#include "minimcp/resources/template.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <unordered_map>

// minimcp-test-client: drives an MCP server through a pair of pipes.
//
// Requests go to stdout, replies are read from stdin and every exchange is
// printed to stderr. Wire it up with a FIFO:
//
//   mkfifo replies
//   minimcp-test-client < replies | minimcp_hello_world > replies

namespace
{

using minimcp::Json;
namespace protocol = minimcp::protocol;

static int usage(int exit_code = 1)
{
    std::cerr << "minimcp-test-client\n";
    std::cerr << "Usage:\n";
    std::cerr << "  minimcp-test-client --help\n";
    std::cerr << "  minimcp-test-client < server_output | server > server_output\n";
    std::cerr << "\n";
    std::cerr << "Sends get_server_info, list_tools, call_tool for every tool, list_resources,\n";
    std::cerr << "read_resource for every resource and template, and prints each exchange.\n";
    return exit_code;
}

class TestClient
{
  public:
    std::optional<protocol::Response> send(const std::string& method,
                                           Json params = Json::object())
    {
        protocol::Request request;
        request.id = next_id_++;
        request.method = method;
        request.params = std::move(params);

        std::cerr << "\n=== Sending Request ===\n" << Json(request).dump(2) << "\n";
        std::cout << protocol::encode_request(request) << '\n';
        std::cout.flush();

        std::string line;
        if (!std::getline(std::cin, line))
        {
            std::cerr << "\nNo response received\n";
            return std::nullopt;
        }

        try
        {
            auto response = protocol::decode_response(line);
            std::cerr << "=== Received Response ===\n" << Json(response).dump(2) << "\n";
            if (response.id() != request.id)
                minimcp::log::logger()->warn("response id {} does not match request id {}",
                                             response.id().dump(), request.id.dump());
            return response;
        }
        catch (const minimcp::McpError& e)
        {
            minimcp::log::logger()->error("undecodable response: {}", e.what());
            return std::nullopt;
        }
    }

    void run()
    {
        section("get_server_info");
        send("get_server_info");

        section("list_tools");
        if (auto tools = list("list_tools", "tools"))
        {
            for (const auto& tool : *tools)
            {
                section("tool: " + tool.value("name", std::string{}));
                send("call_tool", Json{{"name", tool.value("name", std::string{})},
                                       {"arguments", sample_arguments(tool)}});
            }
        }

        section("list_resources");
        if (auto resources = list("list_resources", "resources"))
        {
            for (const auto& resource : *resources)
            {
                section("resource: " + resource.value("uri", std::string{}));
                send("read_resource", Json{{"uri", resource.value("uri", std::string{})}});
            }
        }

        section("list_resource_templates");
        if (auto templates = list("list_resource_templates", "resource_templates"))
        {
            for (const auto& entry : *templates)
            {
                std::string uri_template = entry.value("uri_template", std::string{});
                section("resource template: " + uri_template);
                send("read_resource", Json{{"uri", sample_uri(uri_template)}});
            }
        }

        std::cerr << "\n\nAll tests completed!\n";
    }

  private:
    static void section(const std::string& title)
    {
        std::cerr << "\n\n=== Testing " << title << " ===\n";
    }

    std::optional<Json> list(const std::string& method, const char* key)
    {
        auto response = send(method);
        if (!response || response->is_error())
            return std::nullopt;
        const Json& result = response->result();
        if (!result.is_object() || !result.contains(key) || !result[key].is_array())
            return std::nullopt;
        return result[key];
    }

    // One plausible value per declared property, by type
    static Json sample_arguments(const Json& tool)
    {
        Json args = Json::object();
        auto schema = tool.find("input_schema");
        if (schema == tool.end() || !schema->is_object() || !schema->contains("properties"))
            return args;

        for (const auto& [name, prop] : (*schema)["properties"].items())
        {
            std::string type = prop.is_object() ? prop.value("type", std::string{}) : "";
            if (type == "string")
            {
                if (prop.contains("enum") && prop["enum"].is_array() && !prop["enum"].empty())
                    args[name] = prop["enum"].front();
                else
                    args[name] = "test";
            }
            else if (type == "number" || type == "integer")
                args[name] = 42;
            else if (type == "boolean")
                args[name] = true;
            else if (type == "array")
                args[name] = Json::array();
            else if (type == "object")
                args[name] = Json::object();
            else
                args[name] = nullptr;
        }
        return args;
    }

    static std::string sample_uri(const std::string& uri_template)
    {
        std::unordered_map<std::string, std::string> values;
        for (const auto& name : minimcp::resources::extract_params(uri_template))
            values[name] = "test";

        minimcp::resources::ResourceTemplate templ;
        templ.uri_template = uri_template;
        return templ.expand(values);
    }

    int next_id_{0};
};

} // namespace

int main(int argc, char** argv)
{
    if (argc > 1)
    {
        std::string arg = argv[1];
        return usage(arg == "--help" || arg == "-h" ? 0 : 1);
    }

    if (::isatty(STDIN_FILENO))
    {
        std::cerr << "Error: this client must be connected to an MCP server through pipes.\n\n";
        return usage();
    }

    try
    {
        TestClient client;
        client.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
