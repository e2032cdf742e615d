#pragma once

#include "manifest.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

inline constexpr std::string_view kUtf8Bom{ "\xEF\xBB\xBF" };

// Required search-path lines, in order: stdlib zip, ".", the package directory
// (backslash separated), "import site".
std::vector<std::string> pth_required_lines(interpreter_cfg const &interpreter,
                                            std::string_view package_dir);

// Required lines first, then any other non-comment entries of `existing` not
// already present. A BOM or stray CR in `existing` is dropped.
std::vector<std::string> pth_merge(std::string_view existing,
                                   std::vector<std::string> const &required);

// CRLF-terminated lines, no BOM.
std::string pth_serialize(std::vector<std::string> const &lines);

bool pth_starts_with_bom(std::filesystem::path const &file);

// Write `lines`, re-read the raw bytes and throw pipeline_error (patch_invariant)
// if the file starts with a BOM.
void pth_write(std::filesystem::path const &file, std::vector<std::string> const &lines);

// Rewrite <interpreter_dir>/<pythonXY._pth>. Returns the file path.
std::filesystem::path pth_patch(std::filesystem::path const &interpreter_dir,
                                interpreter_cfg const &interpreter,
                                std::string_view package_dir);

}  // namespace rtpack
