#pragma once

#include <chrono>
#include <filesystem>
#include <string_view>

namespace rtpack {

struct libcurl_options {
  std::chrono::seconds timeout{ 120 };  // whole transfer
  std::chrono::seconds connect_timeout{ 30 };
};

void libcurl_ensure_initialized();

// Download `url` into `destination`, truncating it. HTTP errors (>= 400) fail the
// transfer. On failure the partial destination is removed and std::runtime_error
// is thrown.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       libcurl_options const &options);

}  // namespace rtpack
