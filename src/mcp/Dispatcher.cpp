#include "Dispatcher.hpp"
#include "SchemaValidator.hpp"
#include "core/Version.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <utility>

namespace presence_mcp {

namespace {

// Newest last; kDefaultProtocolVersion is answered when the client asks for none of these
constexpr std::array<const char*, 3> kSupportedProtocolVersions = {
    "2024-11-05", "2025-03-26", "2025-06-18"
};

} // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Ready: return "ready";
        case SessionState::Draining: return "draining";
        case SessionState::Terminated: return "terminated";
    }
    return "unknown";
}

DispatcherOptions::DispatcherOptions()
    : server_name(kServerName)
    , server_version(kServerVersion)
    , protocol_version(kDefaultProtocolVersion) {
}

Dispatcher::Dispatcher(const ToolRegistry& registry, DispatcherOptions options)
    : registry_(registry), options_(std::move(options)) {
    spdlog::debug("Dispatcher created with {} tools ({} handshake)", registry_.size(),
                  options_.handshake_policy == HandshakePolicy::Strict ? "strict" : "permissive");
}

std::optional<Response> Dispatcher::dispatch(const json& message) {
    Request request;
    try {
        request = parse_request(message);
    } catch (const ProtocolError& e) {
        spdlog::warn("Rejecting malformed request: {}", e.what());
        return Response::failure(recover_id(message), e.to_error_object());
    }

    if (request.is_notification()) {
        handle_notification(request);
        return std::nullopt;
    }

    const json& id = *request.id;
    spdlog::debug("Handling request: method={}, id={}", request.method, id.dump());

    try {
        if (request.method == "initialize") {
            return Response::success(id, handle_initialize(request.params));
        } else if (request.method == "ping") {
            return Response::success(id, json::object());
        } else if (request.method == "tools/list") {
            return Response::success(id, handle_tools_list());
        } else if (request.method == "tools/call") {
            if (state_ != SessionState::Ready && options_.handshake_policy == HandshakePolicy::Strict) {
                throw ProtocolError(ErrorCode::NotInitialized,
                                    "Server not initialized: send initialize first");
            }
            return Response::success(id, handle_tools_call(request.params));
        }
        throw ProtocolError(ErrorCode::MethodNotFound, "Method not found: " + request.method,
                            json{{"method", request.method}});
    } catch (const ProtocolError& e) {
        spdlog::info("Request {} ({}) failed: {} {}", id.dump(), request.method,
                     to_string(e.code()), e.what());
        return Response::failure(id, e.to_error_object());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        return Response::failure(id, {ErrorCode::InternalError,
                                      std::string("Internal error: ") + e.what(), nullptr});
    }
}

std::optional<Response> Dispatcher::reject_frame(const json& recovered_id, const std::string& diagnostic) {
    if (recovered_id.is_null()) {
        spdlog::warn("Dropping undecodable frame without id: {}", diagnostic);
        return std::nullopt;
    }
    spdlog::warn("Undecodable frame for id {}: {}", recovered_id.dump(), diagnostic);
    return Response::failure(recovered_id, {ErrorCode::ParseError, "Parse error",
                                            json{{"detail", diagnostic}}});
}

void Dispatcher::begin_drain() {
    spdlog::debug("Session {} -> draining", to_string(state_));
    state_ = SessionState::Draining;
}

void Dispatcher::terminate() {
    state_ = SessionState::Terminated;
}

json Dispatcher::handle_initialize(const json& params) {
    std::string negotiated = options_.protocol_version;

    if (params.is_object()) {
        if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
            std::string client_name = params["clientInfo"].value("name", "unknown");
            std::string client_version = params["clientInfo"].value("version", "unknown");
            spdlog::info("Client: {} version {}", client_name, client_version);
        }

        if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            std::string requested = params["protocolVersion"].get<std::string>();
            bool supported = false;
            for (const char* version : kSupportedProtocolVersions) {
                if (requested == version) {
                    supported = true;
                    break;
                }
            }
            if (supported) {
                negotiated = requested;
            } else {
                spdlog::warn("Client requested unsupported protocol version '{}', using '{}'",
                             requested, negotiated);
            }
        }
    }

    if (state_ == SessionState::Ready) {
        spdlog::warn("Repeated initialize request, answering again");
    }
    state_ = SessionState::Ready;
    spdlog::info("Session initialized (protocol {})", negotiated);

    return {
        {"protocolVersion", negotiated},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", options_.server_name},
            {"version", options_.server_version},
            {"description", kServerDescription}
        }},
        {"availableTools", registry_.names()}
    };
}

json Dispatcher::handle_tools_list() const {
    json tools_array = json::array();
    for (const auto& tool : registry_.tools()) {
        tools_array.push_back(tool.descriptor.to_json());
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json Dispatcher::handle_tools_call(const json& params) const {
    if (!params.is_object()) {
        throw ProtocolError(ErrorCode::InvalidParams, "Invalid parameter 'params': expected object",
                            json{{"field", "params"}});
    }
    if (!params.contains("name") || !params["name"].is_string()) {
        throw ProtocolError(ErrorCode::InvalidParams, "Invalid parameter 'name': missing tool name",
                            json{{"field", "name"}});
    }

    std::string tool_name = params["name"].get<std::string>();
    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    const RegisteredTool* tool = registry_.find(tool_name);
    if (!tool) {
        throw ProtocolError(ErrorCode::UnknownTool, "Unknown tool: " + tool_name,
                            json{{"tool", tool_name}});
    }

    if (auto violation = SchemaValidator::validate(tool->descriptor, arguments)) {
        throw ProtocolError(ErrorCode::InvalidParams, violation->message(),
                            json{{"tool", tool_name}, {"field", violation->field}});
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    AuditResult result;
    try {
        result = tool->handler(arguments);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", tool_name, e.what());
        throw ProtocolError(ErrorCode::InternalError,
                            "Tool '" + tool_name + "' failed: " + e.what(),
                            json{{"tool", tool_name}});
    }

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.to_markdown()}
            }
        })},
        {"structuredContent", result.to_json()},
        {"isError", false}
    };
}

void Dispatcher::handle_notification(const Request& request) const {
    if (request.method == "notifications/initialized") {
        spdlog::info("Client sent initialized notification");
    } else if (request.method == "notifications/cancelled") {
        spdlog::info("Client cancelled a request; calls run to completion, nothing to cancel");
    } else {
        spdlog::debug("Ignoring notification: {}", request.method);
    }
}

} // namespace presence_mcp
