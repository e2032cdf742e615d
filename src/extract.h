#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct extract_options {
  int strip_components{ 0 };
  bool skip_unsafe{ false };  // warn and skip unsafe entries instead of throwing
};

// False for names that could land outside the extraction root: empty names, a
// leading '/' or '\', a drive designator ("C:"), or any ".." segment.
bool extract_entry_name_is_safe(std::string_view name);

// Entry names in archive order, as stored.
std::vector<std::string> extract_list_entries(std::filesystem::path const &archive_path);

// Extract every entry below `destination`. Throws std::runtime_error on unreadable
// archives, unsafe entry names (unless skipped), or an archive with no regular files.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

}  // namespace rtpack
