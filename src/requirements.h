#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct requirement {
  std::string line;  // as written, comments removed
  std::string name;  // normalized project name
};

// Requirement lines split into the generic "bulk" set and the one package that
// needs isolated handling. The isolated package never appears in `bulk`.
struct dependency_closure {
  std::vector<requirement> bulk;
  std::optional<requirement> isolated;
};

// Lowercase, with runs of '-', '_' and '.' collapsed to a single '-'.
std::string requirement_normalize_name(std::string_view name);

// nullopt for blank lines, comments and pip option lines.
std::optional<requirement> requirement_parse_line(std::string_view line);

std::vector<requirement> requirements_parse(std::string_view content);

dependency_closure requirements_partition(std::vector<requirement> requirements,
                                          std::string_view isolated_name);

dependency_closure requirements_load(std::filesystem::path const &file,
                                     std::string_view isolated_name);

}  // namespace rtpack
