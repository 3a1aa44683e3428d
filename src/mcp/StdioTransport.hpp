#pragma once

#include "ITransport.hpp"
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

namespace presence_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from stdin
 * Writes JSON messages line-by-line to stdout with flush
 * Suitable for MCP hosts that spawn the server as a child process
 */
class StdioTransport : public ITransport {
public:
    static constexpr std::size_t kDefaultMaxFrameBytes = 4 * 1024 * 1024;

    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param max_frame_bytes Lines longer than this are rejected unparsed
     */
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    Frame read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    enum class LineStatus {
        Line,
        Oversized,
        EndOfStream
    };

    /**
     * @brief Read one newline-terminated line, keeping at most max_frame_bytes of it
     * @param line Receives the line without its terminator (truncated when oversized)
     * @param line_bytes Receives the full length of the line as sent
     */
    LineStatus read_line(std::string& line, std::size_t& line_bytes);

    std::istream& in_;
    std::ostream& out_;
    std::size_t max_frame_bytes_;
    std::mutex write_mutex_;
};

} // namespace presence_mcp
