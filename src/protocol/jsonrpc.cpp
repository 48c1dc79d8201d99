#include "minimcp/protocol/jsonrpc.hpp"

namespace minimcp::protocol
{

namespace
{
constexpr const char* JSONRPC_VERSION = "2.0";

std::string dump_line(const Json& j)
{
    // Replace invalid UTF-8 rather than failing after the handler already ran
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json parse_document(const std::string& line)
{
    try
    {
        return Json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw ParseError(std::string("Parse error: ") + e.what());
    }
}
} // namespace

void to_json(Json& j, const ErrorObject& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data)
        j["data"] = *e.data;
}

void to_json(Json& j, const Response& r)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}, {"id", r.id()}};
    if (r.is_error())
        j["error"] = r.error();
    else
        j["result"] = r.result();
}

void to_json(Json& j, const Request& r)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}};
    if (!r.id.is_null())
        j["id"] = r.id;
    j["method"] = r.method;
    j["params"] = r.params;
}

Request decode_request(const std::string& line)
{
    Json doc = parse_document(line);
    if (!doc.is_object())
        throw InvalidRequestError("Invalid request: expected a JSON object");

    Request req;
    if (doc.contains("id"))
        req.id = doc["id"];

    auto method = doc.find("method");
    if (method == doc.end() || !method->is_string())
        throw InvalidRequestError("Invalid request: missing method");
    req.method = method->get<std::string>();

    auto params = doc.find("params");
    if (params != doc.end() && !params->is_null())
    {
        if (!params->is_object())
            throw InvalidRequestError("Invalid request: params must be an object");
        req.params = *params;
    }
    return req;
}

Json recover_id(const std::string& line)
{
    Json doc = Json::parse(line, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("id"))
        return Json();
    return doc["id"];
}

std::string encode_response(const Response& response)
{
    return dump_line(Json(response));
}

std::string encode_request(const Request& request)
{
    return dump_line(Json(request));
}

Response decode_response(const std::string& line)
{
    Json doc = parse_document(line);
    if (!doc.is_object())
        throw InvalidRequestError("Invalid response: expected a JSON object");

    Json id = doc.contains("id") ? doc["id"] : Json();
    bool has_result = doc.contains("result");
    bool has_error = doc.contains("error");
    if (has_result == has_error)
        throw InvalidRequestError("Invalid response: expected exactly one of result or error");

    if (has_result)
        return Response::success(std::move(id), doc["result"]);

    const Json& err = doc["error"];
    if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer())
        throw InvalidRequestError("Invalid response: malformed error object");
    if (err.contains("message") && !err["message"].is_string())
        throw InvalidRequestError("Invalid response: error message must be a string");

    ErrorObject e;
    e.code = err["code"].get<int>();
    e.message = err.value("message", std::string{});
    if (err.contains("data"))
        e.data = err["data"];
    return Response::failure(std::move(id), std::move(e));
}

} // namespace minimcp::protocol
