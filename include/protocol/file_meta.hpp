#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <boost/system/error_code.hpp>
#include "protocol/frame.hpp"

namespace protocol {

struct FileMetadata {
    bool is_compressed = false;
    std::string file_name;   // base name only
    uint32_t permissions = 0;
    uint64_t file_len = 0;   // raw content bytes following the metadata frame
};

inline bool operator==(const FileMetadata& a, const FileMetadata& b) {
    return a.is_compressed == b.is_compressed && a.file_name == b.file_name &&
           a.permissions == b.permissions && a.file_len == b.file_len;
}

inline bool operator!=(const FileMetadata& a, const FileMetadata& b) {
    return !(a == b);
}

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileMetadata, is_compressed, file_name, permissions, file_len)

// JSON text of the record. Fails with errc::malformed_metadata if the file
// name is not valid UTF-8.
std::string serialize_file_meta(const FileMetadata& meta, boost::system::error_code& ec);

// Fails with errc::malformed_metadata on bad JSON, missing fields or wrong types.
FileMetadata parse_file_meta(const Bytes& payload, boost::system::error_code& ec);

} // namespace protocol
