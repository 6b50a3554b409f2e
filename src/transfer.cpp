#include "transfer.hpp"
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace transfer {

protocol::Bytes encode_file_message(const std::string& file_path, bool is_compressed,
                                    boost::system::error_code& ec) {
    ec.clear();

    std::error_code fs_ec;
    fs::file_status status = fs::status(file_path, fs_ec);
    if (status.type() == fs::file_type::not_found) {
        ec = protocol::make_error_code(protocol::errc::not_found);
        return {};
    }
    if (fs_ec) {
        ec = protocol::from_std_error(fs_ec);
        return {};
    }
    if (!fs::is_regular_file(status)) {
        ec = protocol::make_error_code(protocol::errc::not_found);
        return {};
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        ec = protocol::make_error_code(protocol::errc::access_denied);
        return {};
    }

    file.seekg(0, std::ios::end);
    std::streamoff file_size = file.tellg();
    file.seekg(0);
    if (file_size < 0) {
        ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
        return {};
    }

    std::vector<uint8_t> content(static_cast<std::size_t>(file_size));
    if (!content.empty() && !file.read(reinterpret_cast<char*>(content.data()), file_size)) {
        ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
        return {};
    }

    protocol::FileMetadata meta;
    meta.is_compressed = is_compressed;
    meta.file_name = fs::path(file_path).filename().string();
    meta.permissions = static_cast<uint32_t>(status.permissions()) & 07777;
    meta.file_len = content.size();

    std::string json = serialize_file_meta(meta, ec);
    if (ec) {
        return {};
    }

    protocol::Bytes encoded = protocol::encode_frame(boost::asio::buffer(json), ec);
    if (ec) {
        return {};
    }
    encoded.insert(encoded.end(), content.begin(), content.end());
    return encoded;
}

protocol::Bytes encode_text_message(const std::string& text, boost::system::error_code& ec) {
    return protocol::encode_frame(boost::asio::buffer(text), ec);
}

bool is_valid_utf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t len = text.size();
    std::size_t i = 0;

    while (i < len) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra;
        uint32_t cp;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
            cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;   // continuation byte, C0/C1 or F5..FF lead
        }

        if (i + extra >= len) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, beyond U+10FFFF
        if ((extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

bool is_plain_file_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

FileWriter::~FileWriter() {
    discard();
}

bool FileWriter::open(const fs::path& dest_dir, const protocol::FileMetadata& meta,
                      boost::system::error_code& ec) {
    ec.clear();
    if (!is_plain_file_name(meta.file_name)) {
        ec = protocol::make_error_code(protocol::errc::malformed_metadata);
        return false;
    }

    final_path_ = dest_dir / meta.file_name;
    part_path_ = dest_dir / (meta.file_name + PART_SUFFIX);
    permissions_ = meta.permissions & 07777;

    // Ensure the destination directory exists
    std::error_code fs_ec;
    if (!dest_dir.empty()) {
        fs::create_directories(dest_dir, fs_ec);
        if (fs_ec) {
            ec = protocol::from_std_error(fs_ec);
            return false;
        }
    }

    file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        std::cerr << "Could not open file for writing: " << part_path_ << "\n";
        ec = protocol::make_error_code(protocol::errc::access_denied);
        return false;
    }
    active_ = true;
    return true;
}

bool FileWriter::write(const uint8_t* data, std::size_t size, boost::system::error_code& ec) {
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file_) {
        ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
        return false;
    }
    return true;
}

bool FileWriter::commit(boost::system::error_code& ec) {
    ec.clear();
    file_.close();
    if (file_.fail()) {
        ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
        return false;
    }

    // Mode goes on the part file so a failure leaves nothing under the final name
    std::error_code fs_ec;
    fs::permissions(part_path_, static_cast<fs::perms>(permissions_), fs::perm_options::replace, fs_ec);
    if (fs_ec) {
        std::cerr << "Failed to set permissions on: " << part_path_ << "\n";
        ec = protocol::from_std_error(fs_ec);
        discard();
        return false;
    }

    fs::rename(part_path_, final_path_, fs_ec);
    if (fs_ec) {
        std::cerr << "Failed to rename temp file to: " << final_path_ << "\n";
        ec = protocol::from_std_error(fs_ec);
        discard();
        return false;
    }
    active_ = false;
    return true;
}

void FileWriter::discard() {
    if (!active_) {
        return;
    }
    active_ = false;
    file_.close();
    std::error_code fs_ec;
    fs::remove(part_path_, fs_ec);
    if (fs_ec) {
        std::cerr << "Failed to remove partial file " << part_path_ << ": " << fs_ec.message() << "\n";
    }
}

} // namespace transfer
