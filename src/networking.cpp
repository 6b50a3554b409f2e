#include "networking.hpp"
#include "file_utils.hpp"
#include "protocol/error.hpp"
#include <iostream>
#include <stdexcept>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

namespace {

void split_command(const std::string& line, std::string& cmd, std::string& arg) {
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        cmd.clear();
        arg.clear();
        return;
    }
    auto cmd_end = line.find_first_of(" \t", start);
    cmd = line.substr(start, cmd_end == std::string::npos ? std::string::npos : cmd_end - start);
    arg.clear();
    if (cmd_end != std::string::npos) {
        auto arg_start = line.find_first_not_of(" \t", cmd_end);
        if (arg_start != std::string::npos) {
            auto arg_end = line.find_last_not_of(" \t");
            arg = line.substr(arg_start, arg_end - arg_start + 1);
        }
    }
}

} // namespace

bool parse_port(const std::string& text, unsigned short& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        return false;
    }
    port = static_cast<unsigned short>(value);
    return true;
}

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(const fs::path& root)
    : acceptor_(io_context_),
      root_(fs::weakly_canonical(fs::absolute(root))) {}

Server::~Server() {
    stop();
    join_sessions();
}

unsigned short Server::listen(unsigned short port) {
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    running_ = true;

    unsigned short bound = acceptor_.local_endpoint().port();
    std::cout << "Serving " << root_.string() << " on port " << bound << std::endl;
    return bound;
}

void Server::serve_one() {
    try {
        tcp::socket socket(io_context_);
        acceptor_.accept(socket);
        handle_client(socket);
    } catch (std::exception& e) {
        std::cerr << "Server Exception: " << e.what() << "\n";
    }
}

void Server::run() {
    while (running_) {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (!running_) {
            break;
        }
        if (ec) {
            std::cerr << "Accept failed: " << ec.message() << "\n";
            continue;
        }

        auto shared = std::make_shared<tcp::socket>(std::move(socket));
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        reap_finished_sessions();
        // stop() flips running_ under this lock, so a session added here is
        // always visible to its shutdown pass
        if (!running_) {
            break;
        }
        std::thread worker([this, shared, done] {
            handle_client(*shared);
            *done = true;
        });
        sessions_.push_back(Session{shared, done, std::move(worker)});
    }

    join_sessions();
}

void Server::stop() {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        for (auto& session : sessions_) {
            if (*session.done) {
                continue;
            }
            boost::system::error_code ec;
            session.socket->shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected) {
                std::cerr << "Server stop: shutdown failed: " << ec.message() << "\n";
            }
        }
    }

    // Wake the blocking accept() with a throwaway connection
    boost::system::error_code ec;
    tcp::endpoint local = acceptor_.local_endpoint(ec);
    if (ec) {
        return;
    }
    boost::asio::io_context io_context;
    tcp::socket waker(io_context);
    waker.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), local.port()), ec);
    if (ec) {
        std::cerr << "Server stop: could not wake acceptor: " << ec.message() << "\n";
    }
}

std::size_t Server::session_count() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    reap_finished_sessions();
    return sessions_.size();
}

void Server::reap_finished_sessions() {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

void Server::join_sessions() {
    std::list<Session> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& session : sessions) {
        if (session.thread.joinable()) {
            session.thread.join();
        }
    }
}

void Server::handle_client(tcp::socket& socket) {
    try {
        std::string peer = socket.remote_endpoint().address().to_string();
        std::cout << "Client connected: " << peer << "\n";

        while (true) {
            boost::system::error_code ec;
            std::string line = transfer::MessageReceiver::receive_text(socket, ec);
            if (ec == protocol::errc::invalid_encoding) {
                // The whole frame was consumed, so the stream is still in sync
                if (!reply_error(socket, ec.message())) {
                    break;
                }
                continue;
            }
            if (ec == protocol::errc::connection_closed) {
                std::cout << "Client disconnected: " << peer << "\n";
                break;
            }
            if (ec) {
                std::cerr << "Server receive failed: " << ec.message() << "\n";
                break;
            }

            if (!handle_command(socket, line)) {
                break;
            }
        }
    } catch (std::exception& e) {
        std::cerr << "Server Exception: " << e.what() << "\n";
    }
}

bool Server::handle_command(tcp::socket& socket, const std::string& line) {
    std::string cmd, arg;
    split_command(line, cmd, arg);
    std::cout << "> " << line << "\n";

    boost::system::error_code ec;

    if (cmd == "quit") {
        return false;
    }

    if (cmd == "ls" || cmd == "tree") {
        fs::path target;
        if (!resolve(arg, target)) {
            return reply_error(socket, "path outside served directory");
        }
        std::string listing = (cmd == "ls") ? file_utils::list_content(target.string(), ec)
                                            : file_utils::tree_list_content(target.string(), ec);
        if (ec) {
            return reply_error(socket, ec.message());
        }
        if (!reply_ok(socket)) {
            return false;
        }
        transfer::MessageSender::send_text(socket, listing, ec);
        return !ec;
    }

    if (cmd == "get") {
        fs::path target;
        if (arg.empty()) {
            return reply_error(socket, "missing path");
        }
        if (!resolve(arg, target)) {
            return reply_error(socket, "path outside served directory");
        }
        protocol::Bytes encoded = transfer::encode_file_message(target.string(), false, ec);
        if (ec) {
            return reply_error(socket, ec.message());
        }
        if (!reply_ok(socket)) {
            return false;
        }
        boost::asio::write(socket, boost::asio::buffer(encoded), ec);
        if (ec) {
            std::cerr << "Server send failed: " << ec.message() << "\n";
            return false;
        }
        std::cout << "Sent " << target.filename().string() << " ("
                  << file_utils::format_size(encoded.size()) << ")\n";
        return true;
    }

    if (cmd == "put") {
        protocol::FileMetadata meta = transfer::MessageReceiver::receive_file_meta(socket, ec);
        if (ec == protocol::errc::connection_closed) {
            return false;
        }
        if (!ec) {
            std::cout << "Incoming file: " << meta.file_name << " ("
                      << file_utils::format_size(meta.file_len) << ")\n";
            transfer::MessageReceiver::receive_file(socket, meta, root_, nullptr, ec);
        }
        if (ec) {
            // The raw content may be partly unread; the stream cannot be resynced
            reply_error(socket, ec.message());
            return false;
        }
        return reply_ok(socket);
    }

    if (cmd == "rm") {
        fs::path target;
        if (arg.empty()) {
            return reply_error(socket, "missing path");
        }
        if (!resolve(arg, target)) {
            return reply_error(socket, "path outside served directory");
        }
        if (target == root_) {
            return reply_error(socket, "cannot delete served directory");
        }
        file_utils::delete_path(target.string(), ec);
        if (ec) {
            return reply_error(socket, ec.message());
        }
        std::cout << "Deleted " << target.string() << "\n";
        return reply_ok(socket);
    }

    return reply_error(socket, "unknown command");
}

bool Server::resolve(const std::string& arg, fs::path& out) const {
    fs::path candidate = arg.empty() ? root_ : (root_ / arg).lexically_normal();
    if (candidate.filename().empty() && candidate.has_parent_path()) {
        candidate = candidate.parent_path();   // "dir/" -> "dir"
    }
    fs::path relative = candidate.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..") {
        return false;
    }
    if (relative == ".") {
        out = root_;
    } else {
        out = root_ / relative;
    }
    return true;
}

bool Server::reply_error(tcp::socket& socket, const std::string& reason) {
    boost::system::error_code ec;
    transfer::MessageSender::send_text(socket, "ERROR " + reason, ec);
    if (ec) {
        std::cerr << "Server send failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool Server::reply_ok(tcp::socket& socket) {
    boost::system::error_code ec;
    transfer::MessageSender::send_text(socket, "OK", ec);
    if (ec) {
        std::cerr << "Server send failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client() : socket_(io_context_) {}

void Client::connect(const std::string& host, unsigned short port) {
    tcp::resolver resolver(io_context_);
    boost::asio::connect(socket_, resolver.resolve(host, std::to_string(port)));
    std::cout << "Connected to " << host << ":" << port << "\n";
}

Reply Client::list(const std::string& path, bool tree) {
    send_command((tree ? "tree " : "ls ") + path);
    Reply reply = read_status();
    if (!reply.ok) {
        return reply;
    }

    boost::system::error_code ec;
    reply.message = transfer::MessageReceiver::receive_text(socket_, ec);
    if (ec) {
        throw boost::system::system_error(ec, "list");
    }
    return reply;
}

Reply Client::get(const std::string& remote, const fs::path& dest_dir,
                  transfer::TransferProgressCallback progress_cb) {
    send_command("get " + remote);
    Reply reply = read_status();
    if (!reply.ok) {
        return reply;
    }

    boost::system::error_code ec;
    protocol::FileMetadata meta = transfer::MessageReceiver::receive_file_meta(socket_, ec);
    if (ec) {
        throw boost::system::system_error(ec, "get");
    }
    fs::path saved = transfer::MessageReceiver::receive_file(socket_, meta, dest_dir, progress_cb, ec);
    if (ec) {
        throw boost::system::system_error(ec, "get " + meta.file_name);
    }
    reply.message = saved.string();
    return reply;
}

Reply Client::put(const std::string& local_path, bool is_compressed) {
    boost::system::error_code ec;
    protocol::Bytes encoded = transfer::encode_file_message(local_path, is_compressed, ec);
    if (ec) {
        return Reply{false, ec.message()};
    }

    send_command("put");
    boost::asio::write(socket_, boost::asio::buffer(encoded), ec);
    if (ec) {
        throw boost::system::system_error(ec, "put");
    }
    return read_status();
}

Reply Client::remove(const std::string& remote) {
    send_command("rm " + remote);
    return read_status();
}

void Client::quit() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    transfer::MessageSender::send_text(socket_, "quit", ec);
    if (ec) {
        std::cerr << "Client quit: " << ec.message() << "\n";
    }
    socket_.close(ec);
}

void Client::send_command(const std::string& line) {
    boost::system::error_code ec;
    transfer::MessageSender::send_text(socket_, line, ec);
    if (ec) {
        throw boost::system::system_error(ec, "send command");
    }
}

Reply Client::read_status() {
    boost::system::error_code ec;
    std::string status = transfer::MessageReceiver::receive_text(socket_, ec);
    if (ec) {
        throw boost::system::system_error(ec, "read status");
    }
    if (status == "OK") {
        return Reply{true, ""};
    }
    const std::string prefix = "ERROR ";
    if (status.compare(0, prefix.size(), prefix) == 0) {
        return Reply{false, status.substr(prefix.size())};
    }
    throw std::runtime_error("Unexpected reply from server: " + status);
}

} // namespace networking
