#include "requirements.h"

#include "tui.h"
#include "util.h"

#include <cctype>
#include <stdexcept>

namespace rtpack {
namespace {

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

bool is_separator(char c) { return c == '-' || c == '_' || c == '.'; }

std::string_view strip_comment(std::string_view line) {
  if (line.starts_with('#')) { return {}; }
  for (auto pos{ line.find('#') }; pos != std::string_view::npos; pos = line.find('#', pos + 1)) {
    if (std::isspace(static_cast<unsigned char>(line[pos - 1]))) { return line.substr(0, pos); }
  }
  return line;
}

}  // namespace

std::string requirement_normalize_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());

  bool pending_separator{ false };
  for (char const c : name) {
    if (is_separator(c)) {
      pending_separator = true;
      continue;
    }
    if (pending_separator && !out.empty()) { out += '-'; }
    pending_separator = false;
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::optional<requirement> requirement_parse_line(std::string_view line) {
  auto const text{ util_trim(strip_comment(util_trim(line))) };
  if (text.empty()) { return std::nullopt; }

  if (text.starts_with('-')) {
    tui::warn("requirements: ignoring pip option line '%.*s'",
              static_cast<int>(text.size()),
              text.data());
    return std::nullopt;
  }

  size_t end{ 0 };
  while (end < text.size() && is_name_char(text[end])) { ++end; }
  if (end == 0) {
    throw std::runtime_error("requirements: cannot parse a project name from '" +
                             std::string{ text } + "'");
  }

  return requirement{ .line = std::string{ text },
                      .name = requirement_normalize_name(text.substr(0, end)) };
}

std::vector<requirement> requirements_parse(std::string_view content) {
  std::vector<requirement> result;

  size_t start{ 0 };
  while (start <= content.size()) {
    auto const end{ content.find('\n', start) };
    auto const line{ content.substr(start,
                                    end == std::string_view::npos ? std::string_view::npos
                                                                  : end - start) };
    if (auto req{ requirement_parse_line(line) }) { result.push_back(std::move(*req)); }
    if (end == std::string_view::npos) { break; }
    start = end + 1;
  }

  return result;
}

dependency_closure requirements_partition(std::vector<requirement> requirements,
                                          std::string_view isolated_name) {
  auto const isolated{ requirement_normalize_name(isolated_name) };

  dependency_closure closure;
  for (auto &req : requirements) {
    if (req.name == isolated) {
      if (closure.isolated) {
        throw std::runtime_error("requirements: " + std::string{ isolated_name } +
                                 " is listed more than once");
      }
      closure.isolated = std::move(req);
    } else {
      closure.bulk.push_back(std::move(req));
    }
  }
  return closure;
}

dependency_closure requirements_load(std::filesystem::path const &file,
                                     std::string_view isolated_name) {
  auto const bytes{ util_load_file(file) };
  std::string_view content{ reinterpret_cast<char const *>(bytes.data()), bytes.size() };
  if (content.starts_with("\xEF\xBB\xBF")) { content.remove_prefix(3); }

  auto closure{ requirements_partition(requirements_parse(content), isolated_name) };
  tui::debug("requirements: %zu bulk, isolated %s",
             closure.bulk.size(),
             closure.isolated ? closure.isolated->line.c_str() : "(not listed)");
  return closure;
}

}  // namespace rtpack
