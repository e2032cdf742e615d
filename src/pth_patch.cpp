#include "pth_patch.h"

#include "pipeline_error.h"
#include "tui.h"
#include "util.h"

#include <algorithm>

namespace rtpack {

std::vector<std::string> pth_required_lines(interpreter_cfg const &interpreter,
                                            std::string_view package_dir) {
  std::string windows_dir{ package_dir };
  std::ranges::replace(windows_dir, '/', '\\');
  return { interpreter.stdlib_zip_name(), ".", windows_dir, "import site" };
}

std::vector<std::string> pth_merge(std::string_view existing,
                                   std::vector<std::string> const &required) {
  while (existing.starts_with(kUtf8Bom)) { existing.remove_prefix(kUtf8Bom.size()); }

  std::vector<std::string> lines{ required };

  size_t start{ 0 };
  while (start < existing.size()) {
    auto const end{ existing.find('\n', start) };
    auto const raw{ existing.substr(start,
                                    end == std::string_view::npos ? std::string_view::npos
                                                                  : end - start) };
    auto const line{ util_trim(raw) };
    if (!line.empty() && !line.starts_with('#') &&
        std::ranges::find(lines, line) == lines.end()) {
      lines.emplace_back(line);
    }
    if (end == std::string_view::npos) { break; }
    start = end + 1;
  }

  return lines;
}

std::string pth_serialize(std::vector<std::string> const &lines) {
  std::string out;
  for (auto const &line : lines) {
    out += line;
    out += "\r\n";
  }
  return out;
}

bool pth_starts_with_bom(std::filesystem::path const &file) {
  auto const prefix{ util_read_prefix(file, kUtf8Bom.size()) };
  return std::ranges::equal(prefix, kUtf8Bom, [](unsigned char a, char b) {
    return a == static_cast<unsigned char>(b);
  });
}

void pth_write(std::filesystem::path const &file, std::vector<std::string> const &lines) {
  util_write_file(file, pth_serialize(lines));

  if (pth_starts_with_bom(file)) {
    throw pipeline_error(error_kind::patch_invariant,
                         file.string(),
                         "path file starts with a UTF-8 byte-order mark after patching",
                         "this is a defect in the patcher, not in the inputs; the interpreter "
                         "would fail to start with 'module not found'");
  }
}

std::filesystem::path pth_patch(std::filesystem::path const &interpreter_dir,
                                interpreter_cfg const &interpreter,
                                std::string_view package_dir) {
  auto const file{ interpreter_dir / interpreter.path_file_name() };

  std::string existing;
  if (std::filesystem::exists(file)) {
    auto const bytes{ util_load_file(file) };
    existing.assign(bytes.begin(), bytes.end());
  } else {
    tui::warn("Path file %s is missing, creating it", file.string().c_str());
  }

  auto const lines{ pth_merge(existing, pth_required_lines(interpreter, package_dir)) };
  pth_write(file, lines);

  tui::info("Patched %s (%zu entries)", file.filename().string().c_str(), lines.size());
  return file;
}

}  // namespace rtpack
