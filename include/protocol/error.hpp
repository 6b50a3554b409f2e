#pragma once

#include <boost/system/error_code.hpp>
#include <system_error>
#include <type_traits>

namespace protocol {

enum class errc {
    frame_too_large = 1,   // payload does not fit the 4-byte length prefix
    connection_closed,     // peer closed or reset before a frame/content was complete
    malformed_metadata,    // metadata frame is not a valid FileMetadata record
    invalid_encoding,      // text frame is not valid UTF-8
    not_found,
    access_denied
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Maps a std::filesystem / OS error onto errc::not_found or
// errc::access_denied where one applies, otherwise a system-category code.
boost::system::error_code from_std_error(const std::error_code& ec) noexcept;

} // namespace protocol

namespace boost {
namespace system {

template <>
struct is_error_code_enum<protocol::errc> : std::true_type {};

} // namespace system
} // namespace boost
