#include "protocol/error.hpp"
#include <string>

namespace protocol {

namespace {

class ErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "framedrop"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::frame_too_large:    return "frame payload exceeds 4-byte length limit";
            case errc::connection_closed:  return "connection closed before message was complete";
            case errc::malformed_metadata: return "malformed file metadata";
            case errc::invalid_encoding:   return "text message is not valid UTF-8";
            case errc::not_found:          return "file not found";
            case errc::access_denied:      return "permission denied";
        }
        return "unknown framedrop error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const ErrorCategory category{};
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), error_category());
}

boost::system::error_code from_std_error(const std::error_code& ec) noexcept {
    if (!ec) {
        return {};
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return make_error_code(errc::not_found);
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return make_error_code(errc::access_denied);
    }
    return boost::system::error_code(ec.value(), boost::system::system_category());
}

} // namespace protocol
