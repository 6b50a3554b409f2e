#include "protocol/frame.hpp"
#include <arpa/inet.h>
#include <boost/asio/error.hpp>
#include <cstring>

namespace protocol {

std::array<uint8_t, FRAME_PREFIX_SIZE> encode_length_prefix(uint32_t length) {
    std::array<uint8_t, FRAME_PREFIX_SIZE> buffer;
    uint32_t net = htonl(length);
    std::memcpy(buffer.data(), &net, FRAME_PREFIX_SIZE);
    return buffer;
}

uint32_t decode_length_prefix(const std::array<uint8_t, FRAME_PREFIX_SIZE>& prefix) {
    uint32_t net;
    std::memcpy(&net, prefix.data(), FRAME_PREFIX_SIZE);
    return ntohl(net);
}

Bytes encode_frame(boost::asio::const_buffer payload, boost::system::error_code& ec) {
    ec.clear();
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        ec = make_error_code(errc::frame_too_large);
        return {};
    }

    auto prefix = encode_length_prefix(static_cast<uint32_t>(payload.size()));
    const auto* data = static_cast<const uint8_t*>(payload.data());

    Bytes frame;
    frame.reserve(FRAME_PREFIX_SIZE + payload.size());
    frame.insert(frame.end(), prefix.begin(), prefix.end());
    frame.insert(frame.end(), data, data + payload.size());
    return frame;
}

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof
        || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::connection_aborted
        || ec == boost::asio::error::broken_pipe;
}

} // namespace protocol
