#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include "protocol/error.hpp"

namespace protocol {

using Bytes = std::vector<uint8_t>;

// Wire layout of a frame:
//
//   +----------------------+---------------------+
//   | length (uint32, BE)  | payload[length]     |
//   +----------------------+---------------------+
//
// The length prefix is always big-endian (network byte order), independent of
// the host.
constexpr std::size_t FRAME_PREFIX_SIZE = 4;
constexpr std::size_t MAX_FRAME_PAYLOAD = std::numeric_limits<uint32_t>::max();

// Receive buffers grow by at most this much ahead of the bytes that arrived,
// so a peer declaring a huge length cannot force a huge allocation.
constexpr std::size_t READ_STEP = 64 * 1024;

std::array<uint8_t, FRAME_PREFIX_SIZE> encode_length_prefix(uint32_t length);
uint32_t decode_length_prefix(const std::array<uint8_t, FRAME_PREFIX_SIZE>& prefix);

// Returns prefix || payload. Fails with errc::frame_too_large (and returns an
// empty buffer) when the payload does not fit the prefix.
Bytes encode_frame(boost::asio::const_buffer payload, boost::system::error_code& ec);

// True for the stream errors that mean the peer went away.
bool is_disconnect(const boost::system::error_code& ec);

// Reads exactly `size` bytes into `data`, looping over short reads. A peer
// that closes before `size` bytes arrived yields errc::connection_closed.
template <typename SyncReadStream>
bool read_exact(SyncReadStream& stream, uint8_t* data, std::size_t size,
                boost::system::error_code& ec) {
    ec.clear();
    std::size_t total = 0;
    while (total < size) {
        std::size_t n = stream.read_some(boost::asio::buffer(data + total, size - total), ec);
        total += n;
        if (ec) {
            if (is_disconnect(ec)) {
                ec = make_error_code(errc::connection_closed);
            }
            return false;
        }
        if (n == 0) {
            ec = make_error_code(errc::connection_closed);
            return false;
        }
    }
    return true;
}

// Reads exactly `size` bytes into `out`, growing it READ_STEP at a time.
// `out` is left empty on failure.
template <typename SyncReadStream>
bool read_exact(SyncReadStream& stream, Bytes& out, std::size_t size,
                boost::system::error_code& ec) {
    ec.clear();
    out.clear();
    while (out.size() < size) {
        std::size_t offset = out.size();
        std::size_t step = std::min(READ_STEP, size - offset);
        out.resize(offset + step);
        if (!read_exact(stream, out.data() + offset, step, ec)) {
            out.clear();
            out.shrink_to_fit();
            return false;
        }
    }
    return true;
}

template <typename SyncReadStream>
Bytes read_frame(SyncReadStream& stream, boost::system::error_code& ec) {
    std::array<uint8_t, FRAME_PREFIX_SIZE> prefix;
    if (!read_exact(stream, prefix.data(), prefix.size(), ec)) {
        return {};
    }

    Bytes payload;
    read_exact(stream, payload, decode_length_prefix(prefix), ec);
    return payload;
}

template <typename SyncWriteStream>
void write_frame(SyncWriteStream& stream, boost::asio::const_buffer payload,
                 boost::system::error_code& ec) {
    Bytes frame = encode_frame(payload, ec);
    if (ec) {
        return;
    }
    boost::asio::write(stream, boost::asio::buffer(frame), ec);
    if (ec && is_disconnect(ec)) {
        ec = make_error_code(errc::connection_closed);
    }
}

} // namespace protocol
