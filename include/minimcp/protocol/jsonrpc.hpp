#pragma once
#include "minimcp/exceptions.hpp"
#include "minimcp/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace minimcp::protocol
{

/// Decoded request envelope. `id` is null when the peer omitted it;
/// `params` is always an object.
struct Request
{
    Json id;
    std::string method;
    Json params = Json::object();
};

struct ErrorObject
{
    int code{static_cast<int>(ErrorCode::InternalError)};
    std::string message;
    std::optional<Json> data;
};

void to_json(Json& j, const ErrorObject& e);

/// Response envelope holding exactly one of result or error.
class Response
{
  public:
    static Response success(Json id, Json result)
    {
        return Response(std::move(id), std::move(result));
    }
    static Response failure(Json id, ErrorObject error)
    {
        return Response(std::move(id), std::move(error));
    }
    static Response failure(Json id, const McpError& error)
    {
        return failure(std::move(id), ErrorObject{error.code_value(), error.what(), error.data()});
    }

    const Json& id() const
    {
        return id_;
    }
    bool is_error() const
    {
        return std::holds_alternative<ErrorObject>(payload_);
    }
    const Json& result() const
    {
        return std::get<Json>(payload_);
    }
    const ErrorObject& error() const
    {
        return std::get<ErrorObject>(payload_);
    }

  private:
    Response(Json id, Json result)
        : id_(std::move(id)), payload_(std::in_place_type<Json>, std::move(result))
    {
    }
    Response(Json id, ErrorObject error)
        : id_(std::move(id)), payload_(std::in_place_type<ErrorObject>, std::move(error))
    {
    }

    Json id_;
    std::variant<Json, ErrorObject> payload_;
};

/// Decode one inbound line.
/// Throws ParseError for malformed JSON and InvalidRequestError for a document
/// that is not a request envelope (not an object, missing or non-string method,
/// non-object params).
Request decode_request(const std::string& line);

/// Best-effort id of a line that failed to decode; null when it cannot be recovered.
Json recover_id(const std::string& line);

/// Encode a response as one line, without the trailing newline.
std::string encode_response(const Response& response);

/// Encode a request as one line, without the trailing newline.
std::string encode_request(const Request& request);

/// Peer-side decoding of a response line.
/// Throws ParseError for malformed JSON and InvalidRequestError when the
/// document carries neither or both of result and error.
Response decode_response(const std::string& line);

// nlohmann::json adapters
void to_json(Json& j, const Response& r);
void to_json(Json& j, const Request& r);

} // namespace minimcp::protocol
