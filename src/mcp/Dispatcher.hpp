#pragma once

#include "JsonRpc.hpp"
#include "ToolRegistry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace presence_mcp {

/**
 * @brief Lifecycle of the single conversation with the host
 */
enum class SessionState {
    Uninitialized,   // no initialize request answered yet
    Ready,           // handshake done
    Draining,        // input closed, finishing up
    Terminated       // session loop exited
};

std::string_view to_string(SessionState state);

/**
 * @brief What to do with tools/call before the handshake
 */
enum class HandshakePolicy {
    Permissive,   // serve it
    Strict        // reject with NotInitialized
};

struct DispatcherOptions {
    HandshakePolicy handshake_policy = HandshakePolicy::Permissive;
    std::string server_name;
    std::string server_version;
    std::string protocol_version;

    DispatcherOptions();
};

/**
 * @brief JSON-RPC/MCP method router
 *
 * Turns one decoded message into at most one Response. Supports methods:
 * initialize, ping, tools/list, tools/call, and ignores notifications.
 * Never throws for bad input; every failure becomes an error Response
 * carrying the request id.
 */
class Dispatcher {
public:
    /**
     * @brief Construct dispatcher over a built registry
     * @param registry Tool catalogue; must outlive the dispatcher
     * @param options Handshake policy and server identity
     */
    explicit Dispatcher(const ToolRegistry& registry, DispatcherOptions options = DispatcherOptions());

    /**
     * @brief Handle one decoded JSON-RPC message
     * @return Response to write, or nullopt for notifications
     */
    std::optional<Response> dispatch(const json& message);

    /**
     * @brief Handle a frame the codec could not decode
     * @param recovered_id Id scanned from the raw bytes, or null
     * @param diagnostic Decoder error text
     * @return ParseError response when an id was recovered, otherwise nullopt
     */
    std::optional<Response> reject_frame(const json& recovered_id, const std::string& diagnostic);

    /// Input stream closed; no further requests will arrive
    void begin_drain();

    /// Session loop has exited
    void terminate();

    SessionState state() const { return state_; }
    const ToolRegistry& registry() const { return registry_; }

private:
    json handle_initialize(const json& params);
    json handle_tools_list() const;
    json handle_tools_call(const json& params) const;
    void handle_notification(const Request& request) const;

    const ToolRegistry& registry_;
    DispatcherOptions options_;
    SessionState state_ = SessionState::Uninitialized;
};

} // namespace presence_mcp
