#include "MockTransport.hpp"
#include <stdexcept>

namespace presence_mcp {

Frame MockTransport::read_message() {
    if (!open_ || frames_.empty()) {
        return Frame::end_of_stream();
    }

    Frame frame = frames_.front();
    frames_.pop();
    return frame;
}

void MockTransport::write_message(const json& message) {
    if (fail_writes_) {
        throw std::runtime_error("write failed");
    }
    if (open_) {
        responses_.push(message);
    }
}

bool MockTransport::is_open() const {
    return open_;
}

void MockTransport::push_request(const json& request) {
    frames_.push(Frame::decoded(request));
}

void MockTransport::push_decode_error(const std::string& error, const json& recovered_id) {
    frames_.push(Frame::decode_error(error, recovered_id));
}

json MockTransport::pop_response() {
    if (responses_.empty()) {
        return json();
    }

    json response = responses_.front();
    responses_.pop();
    return response;
}

bool MockTransport::has_responses() const {
    return !responses_.empty();
}

void MockTransport::close() {
    open_ = false;
}

} // namespace presence_mcp
