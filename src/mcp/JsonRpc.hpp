#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace presence_mcp {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the server
 *
 * -32000..-32099 is the range JSON-RPC leaves to servers; UnknownTool and
 * NotInitialized live there.
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    UnknownTool = -32001,
    NotInitialized = -32002
};

std::string_view to_string(ErrorCode code);

/**
 * @brief JSON-RPC error member
 */
struct ErrorObject {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    json data;  // null when there is no detail payload

    json to_json() const;
};

/**
 * @brief Protocol-level failure raised while handling a message
 *
 * Thrown inside the Dispatcher and converted into an error Response at a
 * single catch site.
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message, json data = nullptr);

    ErrorCode code() const { return code_; }
    const json& data() const { return data_; }
    ErrorObject to_error_object() const;

private:
    ErrorCode code_;
    json data_;
};

/**
 * @brief Decoded JSON-RPC request or notification
 */
struct Request {
    std::optional<json> id;    // absent for notifications
    std::string method;
    json params = json::object();

    bool is_notification() const { return !id.has_value(); }
};

/**
 * @brief JSON-RPC response: exactly one of result or error is set
 */
class Response {
public:
    static Response success(json id, json result);
    static Response failure(json id, ErrorObject error);

    const json& id() const { return id_; }
    bool is_error() const { return error_.has_value(); }
    const json& result() const { return result_; }
    const ErrorObject& error() const { return *error_; }

    json to_json() const;

private:
    Response() = default;

    json id_;
    json result_;
    std::optional<ErrorObject> error_;
};

/**
 * @brief Validate the JSON-RPC envelope and build a Request
 * @param message Parsed JSON value from the wire
 * @throws ProtocolError with ErrorCode::InvalidRequest on a malformed envelope
 */
Request parse_request(const json& message);

/**
 * @brief Best-effort id extraction from a message that failed validation
 * @return The id if it is a string or number, otherwise null
 */
json recover_id(const json& message);

/**
 * @brief Best-effort id extraction from raw text that failed to parse
 *
 * Only an "id" member of the top-level object counts, and only when it
 * appears before the point where the text stops being valid JSON.
 * @return The id if it is a number or string, otherwise null
 */
json recover_id_from_text(std::string_view text);

} // namespace presence_mcp
