#pragma once

#include <cstdint>
#include <string>
#include <boost/system/error_code.hpp>

namespace file_utils {

// Renders `directory` the way the `tree` command does:
//
//   docs
//   ├── a.txt
//   └── sub
//       └── b.txt
//
// Entries are sorted by name. An empty argument means ".", a leading "~"
// expands to $HOME.
std::string tree_list_content(const std::string& directory, boost::system::error_code& ec);

// One entry name per line, sorted, like `ls -1`.
std::string list_content(const std::string& directory, boost::system::error_code& ec);

// Removes a file, or a directory and everything below it.
void delete_path(const std::string& path, boost::system::error_code& ec);

std::string expand_user(const std::string& path);

std::string format_size(uint64_t bytes);

} // namespace file_utils
