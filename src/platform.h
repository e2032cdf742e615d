#pragma once

#include "util.h"

#include <filesystem>
#include <optional>
#include <string>

namespace rtpack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Download cache root: RTPACK_CACHE_ROOT, then the platform's per-user cache dir.
std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

std::filesystem::path get_exe_path();

// Resolve a bare program name against PATH. Names containing a separator are
// returned unchanged when they exist.
std::optional<std::filesystem::path> find_on_path(std::string const &program);

}  // namespace rtpack::platform
