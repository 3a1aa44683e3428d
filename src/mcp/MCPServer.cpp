#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace presence_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, Dispatcher dispatcher)
    : transport_(std::move(transport)), dispatcher_(std::move(dispatcher)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_) {
        try {
            Frame frame = transport_->read_message();
            if (frame.status == FrameStatus::EndOfStream) {
                spdlog::info("Input stream closed, stopping server");
                dispatcher_.begin_drain();
                break;
            }

            std::optional<Response> response;
            if (frame.status == FrameStatus::DecodeError) {
                response = dispatcher_.reject_frame(frame.recovered_id, frame.error);
            } else {
                response = dispatcher_.dispatch(frame.message);
            }

            if (response) {
                send(*response);
            }
        } catch (const std::exception& e) {
            // Dispatcher never throws; a broken transport leaves no channel to answer on
            spdlog::error("Transport failure, stopping server: {}", e.what());
            break;
        }
    }

    // Only stop() leaves the loop with running_ cleared
    if (!running_) {
        spdlog::info("MCPServer stop requested");
    }

    running_ = false;
    dispatcher_.terminate();
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    // Called from signal handlers: a lock-free store and nothing else
    running_.store(false);
}

void MCPServer::send(const Response& response) {
    transport_->write_message(response.to_json());
}

} // namespace presence_mcp
