#pragma once

#include "Dispatcher.hpp"
#include "ITransport.hpp"
#include <atomic>
#include <memory>

namespace presence_mcp {

/**
 * @brief Session loop: read frame, dispatch, write response
 *
 * Owns the transport and the dispatcher for the lifetime of the one
 * conversation with the host. Requests are answered strictly in arrival
 * order on the calling thread.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param dispatcher Method router bound to the tool registry
     * @throws std::invalid_argument if transport is null
     */
    MCPServer(std::unique_ptr<ITransport> transport, Dispatcher dispatcher);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or transport closes.
     * Reads requests, dispatches to handlers, sends responses.
     * Stream closure is a normal return, not an error.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully after the current frame
     */
    void stop();

    const Dispatcher& dispatcher() const { return dispatcher_; }

private:
    void send(const Response& response);

    std::unique_ptr<ITransport> transport_;
    Dispatcher dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace presence_mcp
