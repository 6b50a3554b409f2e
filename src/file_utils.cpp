#include "file_utils.hpp"
#include "protocol/error.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace file_utils {

namespace {

const char* const SPACE = "    ";
const char* const BRANCH = "│   ";
const char* const TEE = "├── ";
const char* const LAST = "└── ";

std::vector<fs::directory_entry> sorted_entries(const fs::path& dir, boost::system::error_code& ec) {
    std::vector<fs::directory_entry> entries;
    std::error_code fs_ec;
    for (fs::directory_iterator it(dir, fs_ec), end; !fs_ec && it != end; it.increment(fs_ec)) {
        entries.push_back(*it);
    }
    if (fs_ec) {
        ec = protocol::from_std_error(fs_ec);
        return {};
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });
    return entries;
}

void tree(const fs::path& dir, const std::string& prefix, std::string& out,
          boost::system::error_code& ec) {
    auto entries = sorted_entries(dir, ec);
    if (ec) {
        return;
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        bool last = (i + 1 == entries.size());
        out += prefix + (last ? LAST : TEE) + entry.path().filename().string() + "\n";

        // Symlinked directories are listed but not descended into
        std::error_code fs_ec;
        if (entry.is_directory(fs_ec) && !entry.is_symlink(fs_ec)) {
            tree(entry.path(), prefix + (last ? SPACE : BRANCH), out, ec);
            if (ec) {
                return;
            }
        }
    }
}

} // namespace

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;   // ~user is left alone
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string tree_list_content(const std::string& directory, boost::system::error_code& ec) {
    ec.clear();
    fs::path dir(expand_user(directory.empty() ? "." : directory));

    std::string name = dir.filename().string();
    if (name.empty()) {
        name = ".";
    }

    std::string out = name + "\n";
    tree(dir, "", out, ec);
    if (ec) {
        return {};
    }
    return out;
}

std::string list_content(const std::string& directory, boost::system::error_code& ec) {
    ec.clear();
    fs::path dir(expand_user(directory.empty() ? "." : directory));

    auto entries = sorted_entries(dir, ec);
    if (ec) {
        return {};
    }

    std::string out;
    for (const auto& entry : entries) {
        out += entry.path().filename().string() + "\n";
    }
    return out;
}

void delete_path(const std::string& path, boost::system::error_code& ec) {
    ec.clear();
    fs::path target(path);

    std::error_code fs_ec;
    fs::file_status status = fs::symlink_status(target, fs_ec);
    if (status.type() == fs::file_type::not_found) {
        ec = protocol::make_error_code(protocol::errc::not_found);
        return;
    }
    if (fs_ec) {
        ec = protocol::from_std_error(fs_ec);
        return;
    }

    if (fs::is_directory(status)) {
        fs::remove_all(target, fs_ec);
    } else {
        fs::remove(target, fs_ec);
    }
    if (fs_ec) {
        ec = protocol::from_std_error(fs_ec);
    }
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

} // namespace file_utils
