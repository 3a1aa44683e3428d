#include "mcp/JsonRpc.hpp"

#include <utility>

namespace presence_mcp {

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

// Watches the SAX event stream for a scalar "id" member of the root object
// and stops as soon as one is seen or the input turns out to be malformed.
class IdRecoveryHandler : public nlohmann::json_sax<json> {
public:
    json id = nullptr;

    bool null() override { return scalar(nullptr); }
    bool boolean(bool value) override { return scalar(value); }
    bool number_integer(number_integer_t value) override { return scalar(value); }
    bool number_unsigned(number_unsigned_t value) override { return scalar(value); }
    bool number_float(number_float_t value, const string_t&) override { return scalar(value); }
    bool string(string_t& value) override { return scalar(value); }
    bool binary(binary_t&) override { return scalar(nullptr); }

    bool start_object(std::size_t) override {
        awaiting_id_ = false;
        ++depth_;
        return true;
    }

    bool key(string_t& name) override {
        awaiting_id_ = depth_ == 1 && name == "id";
        return true;
    }

    bool end_object() override {
        --depth_;
        return true;
    }

    bool start_array(std::size_t) override {
        awaiting_id_ = false;
        ++depth_;
        return true;
    }

    bool end_array() override {
        --depth_;
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const json::exception&) override {
        return false;
    }

private:
    bool scalar(json value) {
        if (!awaiting_id_) {
            return true;
        }
        awaiting_id_ = false;
        if (value.is_string() || value.is_number()) {
            id = std::move(value);
            return false;
        }
        return true;
    }

    std::size_t depth_ = 0;
    bool awaiting_id_ = false;
};

} // namespace

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::MethodNotFound: return "MethodNotFound";
        case ErrorCode::InvalidParams: return "InvalidParams";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::UnknownTool: return "UnknownTool";
        case ErrorCode::NotInitialized: return "NotInitialized";
    }
    return "Unknown";
}

json ErrorObject::to_json() const {
    json error = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return error;
}

ProtocolError::ProtocolError(ErrorCode code, const std::string& message, json data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {
}

ErrorObject ProtocolError::to_error_object() const {
    return {code_, what(), data_};
}

Response Response::success(json id, json result) {
    Response response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

Response Response::failure(json id, ErrorObject error) {
    Response response;
    response.id_ = std::move(id);
    response.error_ = std::move(error);
    return response;
}

json Response::to_json() const {
    json message = {
        {"jsonrpc", "2.0"},
        {"id", id_}
    };
    if (error_) {
        message["error"] = error_->to_json();
    } else {
        message["result"] = result_;
    }
    return message;
}

Request parse_request(const json& message) {
    if (!message.is_object()) {
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: message must be a JSON object");
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: missing or invalid jsonrpc field");
    }

    Request request;
    if (message.contains("id")) {
        if (!is_valid_id(message["id"])) {
            throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: id must be a string, number or null");
        }
        request.id = message["id"];
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: missing method field");
    }
    request.method = message["method"].get<std::string>();

    if (message.contains("params") && !message["params"].is_null()) {
        const auto& params = message["params"];
        if (!params.is_object() && !params.is_array()) {
            throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: params must be an object or array");
        }
        request.params = params;
    }

    return request;
}

json recover_id(const json& message) {
    if (message.is_object() && message.contains("id")) {
        const auto& id = message["id"];
        if (id.is_string() || id.is_number()) {
            return id;
        }
    }
    return nullptr;
}

json recover_id_from_text(std::string_view text) {
    IdRecoveryHandler handler;
    // false whenever the handler stops early or the text breaks off; either way handler.id is final
    static_cast<void>(json::sax_parse(text.begin(), text.end(), &handler));
    return handler.id;
}

} // namespace presence_mcp
