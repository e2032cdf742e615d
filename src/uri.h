#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rtpack {

enum class uri_scheme {
  HTTP,
  HTTPS,
  FTP,
  LOCAL_FILE_ABSOLUTE,
  LOCAL_FILE_RELATIVE,
  UNKNOWN
};

struct uri_info {
  uri_scheme scheme;
  std::string canonical;  // local paths have file:// removed
};

uri_info uri_classify(std::string_view value);

bool uri_is_remote(uri_scheme scheme);

// Resolve a local path (optionally file://) against `anchor`, or the current
// directory when no anchor is given. Throws std::invalid_argument for remote values.
std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Last path component with any query string or fragment removed. Empty when the
// value ends in a separator.
std::string uri_extract_filename(std::string_view uri);

}  // namespace rtpack
