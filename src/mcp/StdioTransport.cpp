#include "StdioTransport.hpp"
#include "JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace presence_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::size_t max_frame_bytes)
    : in_(in), out_(out), max_frame_bytes_(max_frame_bytes) {
    spdlog::debug("StdioTransport initialized (max frame {} bytes)", max_frame_bytes_);
}

StdioTransport::LineStatus StdioTransport::read_line(std::string& line, std::size_t& line_bytes) {
    line.clear();
    line_bytes = 0;

    std::streambuf* buffer = in_.rdbuf();
    if (!buffer) {
        in_.setstate(std::ios::badbit);
        return LineStatus::EndOfStream;
    }

    bool extracted = false;
    char last = '\0';
    while (true) {
        const auto next = buffer->sbumpc();
        if (std::char_traits<char>::eq_int_type(next, std::char_traits<char>::eof())) {
            in_.setstate(std::ios::eofbit);
            if (!extracted) {
                return LineStatus::EndOfStream;
            }
            break;
        }
        extracted = true;

        const char c = std::char_traits<char>::to_char_type(next);
        if (c == '\n') {
            break;
        }
        last = c;
        ++line_bytes;
        // Past the limit the rest of the line is consumed and dropped
        if (line.size() < max_frame_bytes_) {
            line.push_back(c);
        }
    }

    if (last == '\r') {
        --line_bytes;
        if (line.size() > line_bytes) {
            line.pop_back();
        }
    }
    return line_bytes > max_frame_bytes_ ? LineStatus::Oversized : LineStatus::Line;
}

Frame StdioTransport::read_message() {
    std::string line;
    std::size_t line_bytes = 0;

    while (true) {
        LineStatus status = read_line(line, line_bytes);
        if (status == LineStatus::EndOfStream) {
            spdlog::debug("Reached end of input stream");
            return Frame::end_of_stream();
        }

        if (status == LineStatus::Oversized) {
            spdlog::warn("Frame of {} bytes exceeds limit of {}", line_bytes, max_frame_bytes_);
            return Frame::decode_error("Frame exceeds maximum size", recover_id_from_text(line));
        }

        // Blank lines are keep-alives, not frames
        if (line.find_first_not_of(" \t") != std::string::npos) {
            break;
        }
    }

    try {
        json message = json::parse(line);
        spdlog::debug("Read message: {}", line);
        return Frame::decoded(std::move(message));
    } catch (const json::parse_error& e) {
        spdlog::warn("JSON parse error: {}", e.what());
        return Frame::decode_error(e.what(), recover_id_from_text(line));
    }
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << serialized << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write message to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace presence_mcp
