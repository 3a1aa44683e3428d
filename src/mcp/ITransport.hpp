#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace presence_mcp {

using json = nlohmann::json;

/**
 * @brief Outcome of reading one frame from a transport
 */
enum class FrameStatus {
    Message,       // a well-formed JSON value was decoded
    EndOfStream,   // the peer closed the stream
    DecodeError    // bytes were read but could not be decoded
};

/**
 * @brief One decoded frame, or the reason there is none
 */
struct Frame {
    FrameStatus status = FrameStatus::EndOfStream;
    json message;               // set when status == Message
    json recovered_id;          // best-effort id for DecodeError, null if unknown
    std::string error;          // diagnostic for DecodeError

    static Frame decoded(json message) {
        Frame frame;
        frame.status = FrameStatus::Message;
        frame.message = std::move(message);
        return frame;
    }

    static Frame end_of_stream() {
        return Frame{};
    }

    static Frame decode_error(std::string error, json recovered_id = nullptr) {
        Frame frame;
        frame.status = FrameStatus::DecodeError;
        frame.error = std::move(error);
        frame.recovered_id = std::move(recovered_id);
        return frame;
    }
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages via different
 * transport protocols (stdio, pipes, in-memory queues for tests).
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next frame, blocking until one is available
     * @return Decoded message, end-of-stream or decode failure
     */
    virtual Frame read_message() = 0;

    /**
     * @brief Write one JSON-RPC message as a complete frame
     * @param message JSON message to write
     * @throws std::runtime_error if the underlying stream fails
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace presence_mcp
