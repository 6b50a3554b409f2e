#include "protocol/file_meta.hpp"
#include <limits>

namespace protocol {

namespace {

// nlohmann's arithmetic from_json converts bools, floats and negative numbers
// into unsigned fields, so the types are checked before get<FileMetadata>().
bool has_record_types(const nlohmann::json& j) {
    if (!j.is_object()) {
        return false;
    }
    auto compressed = j.find("is_compressed");
    auto name = j.find("file_name");
    auto perms = j.find("permissions");
    auto len = j.find("file_len");
    if (compressed == j.end() || name == j.end() || perms == j.end() || len == j.end()) {
        return false;
    }
    return compressed->is_boolean() && name->is_string() &&
           perms->is_number_unsigned() &&
           perms->get<uint64_t>() <= std::numeric_limits<uint32_t>::max() &&
           len->is_number_unsigned();
}

} // namespace

std::string serialize_file_meta(const FileMetadata& meta, boost::system::error_code& ec) {
    ec.clear();
    try {
        nlohmann::json j = meta;
        return j.dump();
    } catch (const nlohmann::json::exception&) {
        ec = make_error_code(errc::malformed_metadata);
        return {};
    }
}

FileMetadata parse_file_meta(const Bytes& payload, boost::system::error_code& ec) {
    ec.clear();
    try {
        nlohmann::json j = nlohmann::json::parse(payload.begin(), payload.end());
        if (!has_record_types(j)) {
            ec = make_error_code(errc::malformed_metadata);
            return {};
        }
        return j.get<FileMetadata>();
    } catch (const nlohmann::json::exception&) {
        ec = make_error_code(errc::malformed_metadata);
        return {};
    }
}

} // namespace protocol
