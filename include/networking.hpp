#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include <thread>
#include <list>
#include <memory>
#include <mutex>
#include <atomic>
#include <boost/asio.hpp>
#include "transfer.hpp"

namespace networking {

// Status line sent ahead of every command result: "OK" or "ERROR <reason>".
struct Reply {
    bool ok = false;
    std::string message;
};

// Serves one directory tree. Commands arrive as text messages:
//   ls [path] | tree [path] | get <path> | put (+ file message) | rm <path> | quit
class Server {
public:
    explicit Server(const std::filesystem::path& root);
    ~Server();

    // Binds the acceptor; port 0 picks a free port. Returns the bound port.
    unsigned short listen(unsigned short port);

    // Accepts a single connection and serves it on the calling thread.
    void serve_one();

    // Accept loop, one thread per connection, until stop().
    void run();

    // Stops accepting and shuts down every open connection, idle or not.
    void stop();

    // Connections still being served. Finished sessions are reaped first.
    std::size_t session_count();

private:
    struct Session {
        std::shared_ptr<boost::asio::ip::tcp::socket> socket;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    // Caller holds sessions_mutex_.
    void reap_finished_sessions();
    void join_sessions();

    void handle_client(boost::asio::ip::tcp::socket& socket);
    bool handle_command(boost::asio::ip::tcp::socket& socket, const std::string& line);
    bool resolve(const std::string& arg, std::filesystem::path& out) const;

    bool reply_error(boost::asio::ip::tcp::socket& socket, const std::string& reason);
    bool reply_ok(boost::asio::ip::tcp::socket& socket);

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::filesystem::path root_;
    std::atomic<bool> running_{false};
    std::mutex sessions_mutex_;
    std::list<Session> sessions_;
};

// Transport and codec failures throw boost::system::system_error; a refused
// command comes back as Reply{false, reason}.
// Decimal port number in 0..65535. `port` is untouched on failure.
bool parse_port(const std::string& text, unsigned short& port);

class Client {
public:
    Client();

    void connect(const std::string& host, unsigned short port);

    Reply list(const std::string& path, bool tree);
    Reply get(const std::string& remote, const std::filesystem::path& dest_dir,
              transfer::TransferProgressCallback progress_cb = nullptr);
    Reply put(const std::string& local_path, bool is_compressed = false);
    Reply remove(const std::string& remote);
    void quit();

private:
    void send_command(const std::string& line);
    Reply read_status();

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
};

} // namespace networking
