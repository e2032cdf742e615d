#include "packager.h"

#include "extract.h"
#include "pipeline_error.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"
#include "zip_writer.h"

#include <set>
#include <stdexcept>

namespace rtpack {
namespace {

bool is_cache_path(std::filesystem::path const &path) {
  if (path.extension() == ".pyc") { return true; }
  for (auto const &part : path) {
    if (part == "__pycache__") { return true; }
  }
  return false;
}

void copy_tree(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (!std::filesystem::is_directory(from)) {
    throw pipeline_error(error_kind::archive_structure,
                         from.string(),
                         "expected directory is missing from the work tree",
                         "run a clean build; earlier stages did not produce it");
  }

  std::filesystem::create_directories(to);
  for (auto const &entry : std::filesystem::recursive_directory_iterator(from)) {
    auto const rel{ entry.path().lexically_relative(from) };
    if (is_cache_path(rel)) { continue; }

    auto const target{ to / rel };
    if (entry.is_directory()) {
      std::filesystem::create_directories(target);
    } else if (entry.is_regular_file()) {
      std::filesystem::create_directories(target.parent_path());
      std::filesystem::copy_file(entry.path(), target);
    }
  }
}

void copy_single(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (!std::filesystem::is_regular_file(from)) {
    throw pipeline_error(error_kind::archive_structure,
                         from.string(),
                         "required bundle file is missing",
                         "check --app-repo and the LAYOUT entries in rtpack.lua");
  }
  std::filesystem::create_directories(to.parent_path());
  std::filesystem::copy_file(from, to);
}

}  // namespace

void package_manifest::add(std::string const &entry_name, std::filesystem::path const &source) {
  if (!extract_entry_name_is_safe(entry_name)) {
    throw pipeline_error(error_kind::archive_structure,
                         entry_name,
                         "refusing archive entry that is not a relative path",
                         "entry names must be computed relative to the staging root");
  }
  entries_[entry_name] = source;
}

void packager_stage(packager_inputs const &inputs, std::filesystem::path const &stage_dir) {
  std::filesystem::remove_all(stage_dir);
  std::filesystem::create_directories(stage_dir);

  auto const &layout{ inputs.layout };
  copy_tree(inputs.runtime_dir / layout.interpreter_dir,
            stage_dir / "runtime" / layout.interpreter_dir);
  copy_tree(inputs.runtime_dir / layout.vcs_dir, stage_dir / "runtime" / layout.vcs_dir);
  copy_single(inputs.launcher, stage_dir / layout.launcher);
  copy_single(inputs.config_template, stage_dir / layout.config_template);

  tui::debug("packager: staged into %s", stage_dir.string().c_str());
}

package_manifest packager_collect(std::filesystem::path const &stage_dir,
                                  layout_cfg const &layout) {
  package_manifest manifest;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(stage_dir)) {
    if (!entry.is_regular_file()) { continue; }
    manifest.add(entry.path().lexically_relative(stage_dir).generic_string(), entry.path());
  }

  for (auto const &required : { layout.interpreter_entry(),
                                layout.vcs_entry(),
                                layout.launcher,
                                layout.config_template }) {
    if (!manifest.contains(required)) {
      throw pipeline_error(error_kind::archive_structure,
                           required,
                           "canonical bundle path is missing from the staging tree",
                           "check the LAYOUT section of rtpack.lua against the fetched "
                           "distributions");
    }
  }

  return manifest;
}

std::string packager_archive_name(layout_cfg const &layout, std::string const &version) {
  return layout.archive_basename + "-" + version + ".zip";
}

void packager_scan_archive(std::filesystem::path const &archive_path) {
  std::vector<std::string> unsafe;
  for (auto const &name : extract_list_entries(archive_path)) {
    if (!extract_entry_name_is_safe(name)) { unsafe.push_back(name); }
  }
  if (unsafe.empty()) { return; }

  std::string names;
  for (auto const &name : unsafe) { names += (names.empty() ? "" : ", ") + name; }
  throw pipeline_error(error_kind::archive_structure,
                       archive_path.string(),
                       "archive contains absolute-like entries: " + names,
                       "this is a packaging defect; do not distribute this archive");
}

std::string packager_checksum_line(std::string const &hex_digest,
                                   std::filesystem::path const &archive_path) {
  return hex_digest + "  " + archive_path.filename().string() + "\n";
}

package_result packager_write(package_manifest const &manifest,
                              std::filesystem::path const &archive_path) {
  std::filesystem::create_directories(archive_path.parent_path());

  auto tmp{ archive_path };
  tmp += ".tmp";
  scoped_path_cleanup tmp_guard{ tmp };

  {
    zip_writer writer{ tmp, kArchiveMtime };

    std::set<std::string> directories;
    for (auto const &[name, source] : manifest.entries()) {
      for (auto pos{ name.find('/') }; pos != std::string::npos; pos = name.find('/', pos + 1)) {
        auto const dir{ name.substr(0, pos + 1) };
        if (directories.insert(dir).second) { writer.add_directory(dir); }
      }
      writer.add_file(name, source);
    }
    writer.close();
  }

  try {
    packager_scan_archive(tmp);
  } catch (pipeline_error const &) {
    throw;
  } catch (std::exception const &ex) {
    throw pipeline_error(error_kind::archive_structure,
                         tmp.string(),
                         std::string{ "written archive cannot be re-opened: " } + ex.what(),
                         "check free disk space and rerun the build");
  }

  std::filesystem::remove(archive_path);
  std::filesystem::rename(tmp, archive_path);
  tmp_guard.release();

  package_result result{ .archive = archive_path,
                         .checksum_file = {},
                         .sha256 = sha256_hex(archive_path),
                         .entry_count = manifest.size() };

  result.checksum_file = archive_path;
  result.checksum_file += ".sha256";
  util_write_file(result.checksum_file, packager_checksum_line(result.sha256, archive_path));

  tui::info("Wrote %s (%zu files, %s)",
            archive_path.string().c_str(),
            result.entry_count,
            util_format_bytes(std::filesystem::file_size(archive_path)).c_str());
  return result;
}

}  // namespace rtpack
