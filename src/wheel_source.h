#pragma once

#include "manifest.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rtpack {

struct wheel_source_cpu_index {
  std::string index_url;
};

struct wheel_source_accelerated_index {
  std::string tag;
  std::string index_url;
};

struct wheel_source_url {
  std::string url;
};

struct wheel_source_local {
  std::filesystem::path path;  // absolute
};

using wheel_source = std::variant<wheel_source_cpu_index,
                                  wheel_source_accelerated_index,
                                  wheel_source_url,
                                  wheel_source_local>;

inline constexpr char kWheelSourceDefault[]{ "official-cpu" };

// Parse an operator token: "official-cpu", "official-accelerated-<tag>", an
// http(s) URL, or a local path (relative paths resolve against `anchor`). Unknown
// accelerated tags and missing local files throw pipeline_error (config).
wheel_source wheel_source_parse(std::string_view token,
                                wheel_index_cfg const &index,
                                std::optional<std::filesystem::path> const &anchor);

std::string wheel_source_describe(wheel_source const &source);

}  // namespace rtpack
