#include "wheel_source.h"

#include "pipeline_error.h"
#include "uri.h"
#include "util.h"

#include <algorithm>

namespace rtpack {
namespace {

constexpr std::string_view kCpuToken{ "official-cpu" };
constexpr std::string_view kAcceleratedPrefix{ "official-accelerated-" };

std::string join_tags(std::vector<std::string> const &tags) {
  std::string out;
  for (auto const &tag : tags) {
    if (!out.empty()) { out += ", "; }
    out += tag;
  }
  return out.empty() ? "(none configured)" : out;
}

std::string join_url(std::string base, std::string_view tail) {
  while (!base.empty() && base.back() == '/') { base.pop_back(); }
  return base + "/" + std::string{ tail };
}

}  // namespace

wheel_source wheel_source_parse(std::string_view token,
                                wheel_index_cfg const &index,
                                std::optional<std::filesystem::path> const &anchor) {
  auto const value{ util_trim(token) };
  if (value.empty()) {
    throw pipeline_error(error_kind::config,
                         "",
                         "empty wheel source",
                         std::string{ "use --wheel-source " } + kWheelSourceDefault);
  }

  if (value == kCpuToken) { return wheel_source_cpu_index{ index.cpu }; }

  if (value.starts_with(kAcceleratedPrefix)) {
    std::string const tag{ value.substr(kAcceleratedPrefix.size()) };
    if (std::ranges::find(index.accelerated_tags, tag) == index.accelerated_tags.end()) {
      throw pipeline_error(error_kind::config,
                           std::string{ value },
                           "unknown accelerated wheel index tag '" + tag + "'",
                           "configured tags: " + join_tags(index.accelerated_tags) +
                               " (WHEEL_INDEX.accelerated_tags)");
    }
    return wheel_source_accelerated_index{ tag, join_url(index.accelerated_base, tag) };
  }

  auto const info{ uri_classify(value) };
  switch (info.scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS: return wheel_source_url{ info.canonical };

    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE: {
      auto const path{ uri_resolve_local_file_relative(value, anchor) };
      if (!std::filesystem::is_regular_file(path)) {
        throw pipeline_error(error_kind::config,
                             path.string(),
                             "wheel file not found",
                             "pass an existing .whl file, a URL, or " +
                                 std::string{ kCpuToken });
      }
      return wheel_source_local{ path };
    }

    default: break;
  }

  throw pipeline_error(error_kind::config,
                       std::string{ value },
                       "unrecognized wheel source",
                       "use official-cpu, official-accelerated-<tag>, an https URL or a "
                       "local .whl path");
}

std::string wheel_source_describe(wheel_source const &source) {
  return std::visit(
      match{
          [](wheel_source_cpu_index const &s) { return "official CPU index (" + s.index_url + ")"; },
          [](wheel_source_accelerated_index const &s) {
            return "official accelerated index '" + s.tag + "' (" + s.index_url + ")";
          },
          [](wheel_source_url const &s) { return "explicit URL " + s.url; },
          [](wheel_source_local const &s) { return "local wheel " + s.path.string(); },
      },
      source);
}

}  // namespace rtpack
