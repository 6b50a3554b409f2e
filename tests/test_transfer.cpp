#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <filesystem>
#include <string>
#include <unistd.h>

#include "transfer.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using test_helpers::ChunkedReadStream;
using test_helpers::read_file;
using test_helpers::to_bytes;
using test_helpers::to_string;
using test_helpers::write_file;

class TransferTest : public test_helpers::TempDirTest {};

TEST_F(TransferTest, FileMessageCarriesMetadataThenRawContent)
{
    fs::path note = dir() / "note.txt";
    write_file(note, "hello");
    fs::permissions(note, static_cast<fs::perms>(0644), fs::perm_options::replace);

    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message(note.string(), false, ec);
    ASSERT_FALSE(ec) << ec.message();

    ChunkedReadStream stream(encoded, 3);
    protocol::FileMetadata meta = transfer::decode_metadata(stream, ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(meta.file_name, "note.txt");
    EXPECT_EQ(meta.permissions, 0644u);
    EXPECT_EQ(meta.file_len, 5u);
    EXPECT_FALSE(meta.is_compressed);

    // Content is not framed: exactly file_len raw bytes remain
    EXPECT_EQ(stream.remaining(), 5u);
    auto content = transfer::read_file_content(stream, meta, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(to_string(content), "hello");
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST_F(TransferTest, CompressedFlagAndPathStripping)
{
    fs::create_directories(dir() / "nested");
    fs::path file = dir() / "nested" / "data.bin";
    write_file(file, std::string("\x00\x01\x02", 3));

    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message(file.string(), true, ec);
    ASSERT_FALSE(ec);

    ChunkedReadStream stream(encoded, 64);
    auto meta = transfer::decode_metadata(stream, ec);
    ASSERT_FALSE(ec);
    EXPECT_TRUE(meta.is_compressed);
    EXPECT_EQ(meta.file_name, "data.bin");
    EXPECT_EQ(meta.file_len, 3u);
}

TEST_F(TransferTest, EmptyFileHasNoContentBytes)
{
    fs::path empty = dir() / "empty";
    write_file(empty, "");

    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message(empty.string(), false, ec);
    ASSERT_FALSE(ec);

    ChunkedReadStream stream(encoded, 64);
    auto meta = transfer::decode_metadata(stream, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(meta.file_len, 0u);
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST_F(TransferTest, MissingFileIsNotFound)
{
    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message((dir() / "nope.txt").string(), false, ec);
    EXPECT_EQ(ec, protocol::errc::not_found);
    EXPECT_TRUE(encoded.empty());
}

TEST_F(TransferTest, DirectoryIsNotFound)
{
    boost::system::error_code ec;
    transfer::encode_file_message(dir().string(), false, ec);
    EXPECT_EQ(ec, protocol::errc::not_found);
}

TEST_F(TransferTest, UnreadableFileIsAccessDenied)
{
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    fs::path secret = dir() / "secret.txt";
    write_file(secret, "top secret");
    fs::permissions(secret, fs::perms::none, fs::perm_options::replace);

    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message(secret.string(), false, ec);
    EXPECT_EQ(ec, protocol::errc::access_denied);
    EXPECT_TRUE(encoded.empty());
    EXPECT_NE(ec, protocol::errc::not_found);
}

TEST(FileMetadataTest, RecordSurvivesFraming)
{
    protocol::FileMetadata record;
    record.is_compressed = true;
    record.file_name = "r\xC3\xA9sum\xC3\xA9 final.pdf";
    record.permissions = 0755;
    record.file_len = 5000000000ull;

    boost::system::error_code ec;
    std::string json = protocol::serialize_file_meta(record, ec);
    ASSERT_FALSE(ec);
    auto frame = protocol::encode_frame(boost::asio::buffer(json), ec);

    ChunkedReadStream stream(frame, 5);
    EXPECT_EQ(transfer::decode_metadata(stream, ec), record);
    EXPECT_FALSE(ec);
}

TEST(FileMetadataTest, FieldOrderDoesNotMatter)
{
    std::string json = R"({"file_len": 3, "permissions": 420, "file_name": "a.txt", "is_compressed": false})";
    boost::system::error_code ec;
    auto meta = protocol::parse_file_meta(to_bytes(json), ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(meta.file_name, "a.txt");
    EXPECT_EQ(meta.permissions, 420u);
    EXPECT_EQ(meta.file_len, 3u);
}

TEST(FileMetadataTest, UsesFixedFieldNames)
{
    protocol::FileMetadata record{false, "x", 0600, 9};
    boost::system::error_code ec;
    auto j = nlohmann::json::parse(protocol::serialize_file_meta(record, ec));
    EXPECT_EQ(j.size(), 4u);
    EXPECT_EQ(j.at("is_compressed"), false);
    EXPECT_EQ(j.at("file_name"), "x");
    EXPECT_EQ(j.at("permissions"), 0600);
    EXPECT_EQ(j.at("file_len"), 9);
}

TEST(FileMetadataTest, MalformedPayloadsAreRejected)
{
    const char* cases[] = {
        "not json",
        R"({"file_name": "a", "permissions": 420, "file_len": 1)",
        R"({"file_name": "a", "permissions": 420, "file_len": 1})",
        R"({"is_compressed": false, "file_name": 7, "permissions": 420, "file_len": 1})",
        R"({"is_compressed": false, "file_name": "a", "permissions": "rw", "file_len": 1})",
        R"(["is_compressed", "file_name"])",
        "",
        R"({"is_compressed": false, "file_name": "a", "permissions": 420, "file_len": -1})",
        R"({"is_compressed": false, "file_name": "a", "permissions": 1.5, "file_len": 2.9})",
        R"({"is_compressed": 1, "file_name": "a", "permissions": 420, "file_len": 1})",
        R"({"is_compressed": false, "file_name": "a", "permissions": 4294967296, "file_len": 1})",
        R"({"is_compressed": false, "file_name": "a", "permissions": true, "file_len": 1})",
    };
    for (const char* text : cases) {
        boost::system::error_code ec;
        auto frame = protocol::encode_frame(boost::asio::buffer(std::string(text)), ec);
        ChunkedReadStream stream(frame, 64);
        transfer::decode_metadata(stream, ec);
        EXPECT_EQ(ec, protocol::errc::malformed_metadata) << text;
    }
}

TEST(FileMetadataTest, TruncatedMetadataFrameIsConnectionClosed)
{
    protocol::FileMetadata record{false, "a", 0644, 1};
    boost::system::error_code ec;
    std::string json = protocol::serialize_file_meta(record, ec);
    auto frame = protocol::encode_frame(boost::asio::buffer(json), ec);
    frame.pop_back();

    ChunkedReadStream stream(frame, 64);
    transfer::decode_metadata(stream, ec);
    EXPECT_EQ(ec, protocol::errc::connection_closed);
}

TEST(FileMetadataTest, HugeFileLenWithoutContentIsConnectionClosed)
{
    protocol::FileMetadata meta{false, "liar.bin", 0644, 1ull << 40};
    ChunkedReadStream stream(to_bytes("tiny"), 1 << 20);

    boost::system::error_code ec;
    auto content = transfer::read_file_content(stream, meta, ec);
    EXPECT_EQ(ec, protocol::errc::connection_closed);
    EXPECT_TRUE(content.empty());
    EXPECT_LE(stream.largest_request(), protocol::READ_STEP);
}

TEST(TextMessageTest, PingRoundTrip)
{
    boost::system::error_code ec;
    auto encoded = transfer::encode_text_message("ping", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(encoded, protocol::Bytes({0, 0, 0, 4, 'p', 'i', 'n', 'g'}));

    ChunkedReadStream stream(encoded, 1);
    EXPECT_EQ(transfer::decode_text_message(stream, ec), "ping");
    EXPECT_FALSE(ec);
}

TEST(TextMessageTest, MultiByteTextRoundTrip)
{
    std::string text = "h\xC3\xA9llo \xE2\x9C\x93 \xF0\x9F\x9A\x80";
    boost::system::error_code ec;
    auto encoded = transfer::encode_text_message(text, ec);
    ChunkedReadStream stream(encoded, 2);
    EXPECT_EQ(transfer::decode_text_message(stream, ec), text);
    EXPECT_FALSE(ec);
}

TEST(TextMessageTest, InvalidUtf8IsRejected)
{
    const std::string cases[] = {
        "\xC3\x28",            // bad continuation
        "\xC0\xAF",            // overlong '/'
        "\xE0\x80\xAF",        // overlong '/'
        "\xED\xA0\x80",        // surrogate
        "\xF4\x90\x80\x80",    // above U+10FFFF
        "abc\xE2\x82",         // truncated sequence
        "\x80",                // stray continuation
    };
    for (const auto& text : cases) {
        boost::system::error_code ec;
        auto frame = protocol::encode_frame(boost::asio::buffer(text), ec);
        ChunkedReadStream stream(frame, 64);
        auto decoded = transfer::decode_text_message(stream, ec);
        EXPECT_EQ(ec, protocol::errc::invalid_encoding);
        EXPECT_TRUE(decoded.empty());
    }
}

TEST(TextMessageTest, OverStreamSocket)
{
    boost::asio::io_context io_context;
    boost::asio::local::stream_protocol::socket a(io_context), b(io_context);
    boost::asio::local::connect_pair(a, b);

    boost::system::error_code ec;
    transfer::MessageSender::send_text(a, "ls /tmp", ec);
    ASSERT_FALSE(ec);
    transfer::MessageSender::send_text(a, "", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(transfer::MessageReceiver::receive_text(b, ec), "ls /tmp");
    EXPECT_EQ(transfer::MessageReceiver::receive_text(b, ec), "");
    EXPECT_FALSE(ec);
}

TEST(FileNameTest, OnlyPlainNamesAreAccepted)
{
    EXPECT_TRUE(transfer::is_plain_file_name("note.txt"));
    EXPECT_TRUE(transfer::is_plain_file_name(".hidden"));
    EXPECT_FALSE(transfer::is_plain_file_name(""));
    EXPECT_FALSE(transfer::is_plain_file_name("."));
    EXPECT_FALSE(transfer::is_plain_file_name(".."));
    EXPECT_FALSE(transfer::is_plain_file_name("../evil"));
    EXPECT_FALSE(transfer::is_plain_file_name("/etc/passwd"));
}

class ReceiveFileTest : public test_helpers::TempDirTest {};

TEST_F(ReceiveFileTest, WritesFileWithDeclaredPermissions)
{
    fs::path src_dir = dir() / "src";
    fs::path dst_dir = dir() / "dst";
    fs::create_directories(src_dir);
    std::string content(200000, 'x');
    write_file(src_dir / "big.dat", content);
    fs::permissions(src_dir / "big.dat", static_cast<fs::perms>(0640), fs::perm_options::replace);

    boost::system::error_code ec;
    auto encoded = transfer::encode_file_message((src_dir / "big.dat").string(), false, ec);
    ASSERT_FALSE(ec);

    ChunkedReadStream stream(encoded, 4096);
    auto meta = transfer::MessageReceiver::receive_file_meta(stream, ec);
    ASSERT_FALSE(ec);

    uint64_t last_done = 0;
    auto saved = transfer::MessageReceiver::receive_file(
        stream, meta, dst_dir,
        [&](const std::string& name, uint64_t done, uint64_t total, double) {
            EXPECT_EQ(name, "big.dat");
            EXPECT_EQ(total, content.size());
            last_done = done;
        },
        ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(saved, dst_dir / "big.dat");
    EXPECT_EQ(read_file(saved), content);
    EXPECT_EQ(last_done, content.size());
    EXPECT_EQ(static_cast<unsigned>(fs::status(saved).permissions()), 0640u);
    EXPECT_FALSE(fs::exists(dst_dir / (std::string("big.dat") + transfer::PART_SUFFIX)));
}

TEST_F(ReceiveFileTest, TruncatedContentLeavesNothingBehind)
{
    protocol::FileMetadata meta{false, "cut.txt", 0644, 10};
    ChunkedReadStream stream(to_bytes("only5"), 2);

    boost::system::error_code ec;
    auto saved = transfer::MessageReceiver::receive_file(stream, meta, dir(), nullptr, ec);
    EXPECT_EQ(ec, protocol::errc::connection_closed);
    EXPECT_TRUE(saved.empty());
    EXPECT_FALSE(fs::exists(dir() / "cut.txt"));
    EXPECT_FALSE(fs::exists(dir() / (std::string("cut.txt") + transfer::PART_SUFFIX)));
}

TEST_F(ReceiveFileTest, RejectsNamesWithDirectories)
{
    protocol::FileMetadata meta{false, "../escape.txt", 0644, 3};
    ChunkedReadStream stream(to_bytes("abc"), 8);

    boost::system::error_code ec;
    transfer::MessageReceiver::receive_file(stream, meta, dir(), nullptr, ec);
    EXPECT_EQ(ec, protocol::errc::malformed_metadata);
    EXPECT_FALSE(fs::exists(dir().parent_path() / "escape.txt"));
}

TEST_F(ReceiveFileTest, ReplacesExistingFile)
{
    write_file(dir() / "same.txt", "old contents that are longer");
    protocol::FileMetadata meta{false, "same.txt", 0600, 3};
    ChunkedReadStream stream(to_bytes("new"), 8);

    boost::system::error_code ec;
    transfer::MessageReceiver::receive_file(stream, meta, dir(), nullptr, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(read_file(dir() / "same.txt"), "new");
}

TEST_F(ReceiveFileTest, ReadOnlyModeIsAppliedBeforeRename)
{
    protocol::FileMetadata meta{false, "locked.txt", 0444, 4};
    ChunkedReadStream stream(to_bytes("data"), 8);

    boost::system::error_code ec;
    auto saved = transfer::MessageReceiver::receive_file(stream, meta, dir(), nullptr, ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_file(saved), "data");
    EXPECT_EQ(static_cast<unsigned>(fs::status(saved).permissions()), 0444u);
    EXPECT_FALSE(fs::exists(dir() / (std::string("locked.txt") + transfer::PART_SUFFIX)));
}

TEST_F(ReceiveFileTest, FailedCommitRemovesPartFile)
{
    // A non-empty directory under the final name makes the rename fail
    fs::create_directories(dir() / "taken" / "inside");
    protocol::FileMetadata meta{false, "taken", 0644, 3};
    ChunkedReadStream stream(to_bytes("abc"), 8);

    boost::system::error_code ec;
    auto saved = transfer::MessageReceiver::receive_file(stream, meta, dir(), nullptr, ec);
    EXPECT_TRUE(ec);
    EXPECT_TRUE(saved.empty());
    EXPECT_TRUE(fs::is_directory(dir() / "taken" / "inside"));
    EXPECT_FALSE(fs::exists(dir() / (std::string("taken") + transfer::PART_SUFFIX)));
}
