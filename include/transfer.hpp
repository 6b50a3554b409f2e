#pragma once

#include <string>
#include <functional>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <algorithm>
#include <limits>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include "protocol/frame.hpp"
#include "protocol/file_meta.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

constexpr std::size_t CHUNK_SIZE = 64 * 1024;
constexpr const char* PART_SUFFIX = ".framepart";

// Frame(JSON metadata) || raw file bytes. The content is not framed; its
// length travels in metadata.file_len.
protocol::Bytes encode_file_message(const std::string& file_path, bool is_compressed,
                                    boost::system::error_code& ec);

protocol::Bytes encode_text_message(const std::string& text, boost::system::error_code& ec);

bool is_valid_utf8(const std::string& text);

// A name with no directory component that cannot walk out of its directory.
bool is_plain_file_name(const std::string& name);

template <typename SyncReadStream>
protocol::FileMetadata decode_metadata(SyncReadStream& socket, boost::system::error_code& ec) {
    protocol::Bytes payload = protocol::read_frame(socket, ec);
    if (ec) {
        return {};
    }
    return protocol::parse_file_meta(payload, ec);
}

// Second step of a file transfer: exactly meta.file_len raw bytes.
template <typename SyncReadStream>
protocol::Bytes read_file_content(SyncReadStream& socket, const protocol::FileMetadata& meta,
                                  boost::system::error_code& ec) {
    protocol::Bytes content;
    if (meta.file_len > std::numeric_limits<std::size_t>::max()) {
        ec = protocol::make_error_code(protocol::errc::malformed_metadata);
        return content;
    }
    protocol::read_exact(socket, content, static_cast<std::size_t>(meta.file_len), ec);
    return content;
}

template <typename SyncReadStream>
std::string decode_text_message(SyncReadStream& socket, boost::system::error_code& ec) {
    protocol::Bytes payload = protocol::read_frame(socket, ec);
    if (ec) {
        return {};
    }
    std::string text(payload.begin(), payload.end());
    if (!is_valid_utf8(text)) {
        ec = protocol::make_error_code(protocol::errc::invalid_encoding);
        return {};
    }
    return text;
}

// Writes an incoming file to <dest_dir>/<name>.framepart and renames it into
// place on commit. An uncommitted file is removed on destruction.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    bool open(const std::filesystem::path& dest_dir, const protocol::FileMetadata& meta,
              boost::system::error_code& ec);
    bool write(const uint8_t* data, std::size_t size, boost::system::error_code& ec);
    bool commit(boost::system::error_code& ec);
    void discard();

    const std::filesystem::path& final_path() const { return final_path_; }

private:
    std::ofstream file_;
    std::filesystem::path part_path_;
    std::filesystem::path final_path_;
    uint32_t permissions_ = 0;
    bool active_ = false;
};

class MessageSender {
public:
    template <typename SyncWriteStream>
    static void send_text(SyncWriteStream& socket, const std::string& message,
                          boost::system::error_code& ec) {
        protocol::Bytes encoded = encode_text_message(message, ec);
        if (ec) {
            return;
        }
        write_all(socket, encoded, ec);
    }

    template <typename SyncWriteStream>
    static void send_file(SyncWriteStream& socket, const std::string& filepath, bool is_compressed,
                          boost::system::error_code& ec) {
        protocol::Bytes encoded = encode_file_message(filepath, is_compressed, ec);
        if (ec) {
            return;
        }
        write_all(socket, encoded, ec);
    }

private:
    template <typename SyncWriteStream>
    static void write_all(SyncWriteStream& socket, const protocol::Bytes& data,
                          boost::system::error_code& ec) {
        boost::asio::write(socket, boost::asio::buffer(data), ec);
        if (ec && protocol::is_disconnect(ec)) {
            ec = protocol::make_error_code(protocol::errc::connection_closed);
        }
    }
};

class MessageReceiver {
public:
    template <typename SyncReadStream>
    static std::string receive_text(SyncReadStream& socket, boost::system::error_code& ec) {
        return decode_text_message(socket, ec);
    }

    template <typename SyncReadStream>
    static protocol::FileMetadata receive_file_meta(SyncReadStream& socket, boost::system::error_code& ec) {
        return decode_metadata(socket, ec);
    }

    // Streams meta.file_len raw bytes to disk. Returns the path written.
    template <typename SyncReadStream>
    static std::filesystem::path receive_file(SyncReadStream& socket, const protocol::FileMetadata& meta,
                                              const std::filesystem::path& dest_dir,
                                              TransferProgressCallback progress_cb,
                                              boost::system::error_code& ec) {
        FileWriter writer;
        if (!writer.open(dest_dir, meta, ec)) {
            return {};
        }

        uint64_t total_received = 0;
        auto start_time = std::chrono::steady_clock::now();
        auto last_cb_time = start_time;

        std::vector<uint8_t> buffer(CHUNK_SIZE);
        while (total_received < meta.file_len) {
            std::size_t want = static_cast<std::size_t>(
                std::min<uint64_t>(buffer.size(), meta.file_len - total_received));
            if (!protocol::read_exact(socket, buffer.data(), want, ec)) {
                return {};
            }
            if (!writer.write(buffer.data(), want, ec)) {
                return {};
            }
            total_received += want;

            if (progress_cb) {
                auto now = std::chrono::steady_clock::now();
                auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
                if (elapsed_since_cb >= 300 || total_received == meta.file_len) {
                    double elapsed = std::chrono::duration<double>(now - start_time).count();
                    double speed = (elapsed > 0) ? (total_received / elapsed / (1024.0 * 1024.0)) : 0;
                    progress_cb(meta.file_name, total_received, meta.file_len, speed);
                    last_cb_time = now;
                }
            }
        }

        if (!writer.commit(ec)) {
            return {};
        }
        return writer.final_path();
    }
};

} // namespace transfer
