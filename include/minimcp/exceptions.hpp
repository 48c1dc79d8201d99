#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace minimcp
{

/// JSON-RPC error codes understood by peers. Values are fixed by the protocol.
enum class ErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

inline const char* to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::ParseError:
        return "ParseError";
    case ErrorCode::InvalidRequest:
        return "InvalidRequest";
    case ErrorCode::MethodNotFound:
        return "MethodNotFound";
    case ErrorCode::InvalidParams:
        return "InvalidParams";
    case ErrorCode::InternalError:
        return "InternalError";
    }
    return "InternalError";
}

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Protocol error. Handlers and resource readers throw it to have
/// {code, message, data} forwarded to the peer unchanged.
class McpError : public Error
{
  public:
    McpError(ErrorCode code, const std::string& message,
             std::optional<nlohmann::json> data = std::nullopt)
        : Error(message), code_(code), data_(std::move(data))
    {
    }

    ErrorCode code() const
    {
        return code_;
    }
    int code_value() const
    {
        return static_cast<int>(code_);
    }
    const std::optional<nlohmann::json>& data() const
    {
        return data_;
    }

  private:
    ErrorCode code_;
    std::optional<nlohmann::json> data_;
};

struct ParseError : public McpError
{
    explicit ParseError(const std::string& message,
                        std::optional<nlohmann::json> data = std::nullopt)
        : McpError(ErrorCode::ParseError, message, std::move(data))
    {
    }
};

struct InvalidRequestError : public McpError
{
    explicit InvalidRequestError(const std::string& message,
                                 std::optional<nlohmann::json> data = std::nullopt)
        : McpError(ErrorCode::InvalidRequest, message, std::move(data))
    {
    }
};

struct MethodNotFoundError : public McpError
{
    explicit MethodNotFoundError(const std::string& message,
                                 std::optional<nlohmann::json> data = std::nullopt)
        : McpError(ErrorCode::MethodNotFound, message, std::move(data))
    {
    }
};

struct InvalidParamsError : public McpError
{
    explicit InvalidParamsError(const std::string& message,
                                std::optional<nlohmann::json> data = std::nullopt)
        : McpError(ErrorCode::InvalidParams, message, std::move(data))
    {
    }
};

struct InternalError : public McpError
{
    explicit InternalError(const std::string& message,
                           std::optional<nlohmann::json> data = std::nullopt)
        : McpError(ErrorCode::InternalError, message, std::move(data))
    {
    }
};

} // namespace minimcp
