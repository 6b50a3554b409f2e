#include <iostream>
#include <string>
#include <cstdint>
#include <filesystem>
#include "networking.hpp"
#include "file_utils.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " serve <port> [root]\n"
              << "  " << prog << " connect <host> <port>\n";
}

void print_help() {
    std::cout << "Commands:\n"
              << "  ls [path]              list a remote directory\n"
              << "  tree [path]            show a remote directory tree\n"
              << "  get <path> [dest_dir]  download a file\n"
              << "  put <local_file>       upload a file\n"
              << "  rm <path>              delete a remote file or directory\n"
              << "  quit\n";
}

void print_reply(const networking::Reply& reply) {
    if (reply.ok) {
        std::cout << reply.message;
        if (!reply.message.empty() && reply.message.back() != '\n') {
            std::cout << "\n";
        }
    } else {
        std::cerr << "Error: " << reply.message << "\n";
    }
}

int run_client(const std::string& host, unsigned short port) {
    networking::Client client;
    try {
        client.connect(host, port);
    } catch (std::exception& e) {
        std::cerr << "Client Exception: " << e.what() << "\n";
        return 1;
    }
    print_help();

    auto progress = [](const std::string& name, uint64_t done, uint64_t total, double speed) {
        int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
        std::cout << "\r" << name << " " << percent << "% | "
                  << file_utils::format_size(done) << " / " << file_utils::format_size(total)
                  << " | " << speed << " MB/s    " << std::flush;
        if (done == total) {
            std::cout << "\n";
        }
    };

    std::string line;
    while (std::cout << "framedrop> " << std::flush, std::getline(std::cin, line)) {
        std::string cmd, arg;
        auto space = line.find(' ');
        cmd = line.substr(0, space);
        if (space != std::string::npos) {
            arg = line.substr(space + 1);
        }

        try {
            if (cmd.empty()) {
                continue;
            } else if (cmd == "quit" || cmd == "exit") {
                break;
            } else if (cmd == "ls" || cmd == "tree") {
                print_reply(client.list(arg, cmd == "tree"));
            } else if (cmd == "get") {
                std::string remote = arg, dest = ".";
                auto sep = arg.find(' ');
                if (sep != std::string::npos) {
                    remote = arg.substr(0, sep);
                    dest = arg.substr(sep + 1);
                }
                auto reply = client.get(remote, dest, progress);
                if (reply.ok) {
                    std::cout << "Saved to " << reply.message << "\n";
                } else {
                    print_reply(reply);
                }
            } else if (cmd == "put") {
                print_reply(client.put(arg));
            } else if (cmd == "rm") {
                print_reply(client.remove(arg));
            } else {
                print_help();
            }
        } catch (std::exception& e) {
            std::cerr << "Client Exception: " << e.what() << "\n";
            return 1;
        }
    }

    client.quit();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string mode = argv[1];
    try {
        if (mode == "serve") {
            unsigned short port = 0;
            if (!networking::parse_port(argv[2], port)) {
                std::cerr << "Invalid port: " << argv[2] << "\n";
                print_usage(argv[0]);
                return 1;
            }
            fs::path root = (argc >= 4) ? fs::path(argv[3]) : fs::path(".");
            if (!fs::is_directory(root)) {
                std::cerr << "Not a directory: " << root.string() << "\n";
                return 1;
            }
            networking::Server server(root);
            server.listen(port);
            server.run();
            return 0;
        }
        if (mode == "connect" && argc >= 4) {
            unsigned short port = 0;
            if (!networking::parse_port(argv[3], port)) {
                std::cerr << "Invalid port: " << argv[3] << "\n";
                print_usage(argv[0]);
                return 1;
            }
            return run_client(argv[2], port);
        }
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
