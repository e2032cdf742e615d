#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rtpack {

inline constexpr char kVersionPlaceholder[]{ "0.0.0-dev" };

// Strip whitespace and one leading 'v'; nullopt unless the rest parses as semver.
std::optional<std::string> version_normalize(std::string_view candidate);

// `git describe --tags` of the repository containing `repo_dir`, normalized.
// nullopt when there is no repository, no tag, or the tag is not semver.
std::optional<std::string> version_from_repository(std::filesystem::path const &repo_dir);

// Override (must be semver, else pipeline_error config), then repository tags, then
// kVersionPlaceholder.
std::string version_resolve(std::optional<std::string> const &override_version,
                            std::optional<std::filesystem::path> const &repo_dir);

}  // namespace rtpack
