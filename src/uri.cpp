#include "uri.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <stdexcept>

namespace rtpack {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

std::string strip_file_scheme(std::string_view uri) {
  std::string_view rest{ uri.substr(7) };
  if (istarts_with(rest, "localhost/")) { rest.remove_prefix(9); }
  return std::string{ rest };
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ util_trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }
  if (istarts_with(canonical, "ftp://")) {
    return uri_info{ uri_scheme::FTP, std::move(canonical) };
  }

  std::string local_source;
  if (istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else if (canonical.find("://") != std::string::npos) {
    return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
  } else {
    local_source = std::move(canonical);
  }

  auto const scheme{ std::filesystem::path{ local_source }.is_absolute()
                         ? uri_scheme::LOCAL_FILE_ABSOLUTE
                         : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local_source) };
}

bool uri_is_remote(uri_scheme scheme) {
  return scheme == uri_scheme::HTTP || scheme == uri_scheme::HTTPS ||
         scheme == uri_scheme::FTP;
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const info{ uri_classify(local_file) };
  if (info.scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      info.scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("uri_resolve_local_file_relative: not a local file: " +
                                std::string{ local_file });
  }

  std::filesystem::path resolved{ info.canonical };
  if (info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    auto const base{ (anchor && !anchor->empty()) ? std::filesystem::absolute(*anchor)
                                                  : std::filesystem::current_path() };
    resolved = base / resolved;
  }
  return resolved.lexically_normal();
}

std::string uri_extract_filename(std::string_view uri) {
  auto const path{ strip_query_and_fragment(util_trim(uri)) };
  auto const sep{ path.find_last_of("/\\") };
  if (sep == std::string_view::npos) { return std::string{ path }; }
  return std::string{ path.substr(sep + 1) };
}

}  // namespace rtpack
