#pragma once

#include "manifest.h"

#include <ctime>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rtpack {

// Entry name -> staged source file. Names are validated on insertion.
class package_manifest {
 public:
  // Throws pipeline_error (archive_structure) for names with a drive designator,
  // a leading separator, or a ".." segment.
  void add(std::string const &entry_name, std::filesystem::path const &source);

  std::map<std::string, std::filesystem::path> const &entries() const { return entries_; }
  bool contains(std::string const &entry_name) const { return entries_.contains(entry_name); }
  std::size_t size() const { return entries_.size(); }

 private:
  std::map<std::string, std::filesystem::path> entries_;
};

struct packager_inputs {
  std::filesystem::path runtime_dir;      // holds <interpreter_dir> and <vcs_dir>
  std::filesystem::path launcher;         // source file
  std::filesystem::path config_template;  // source file
  layout_cfg const &layout;
};

struct package_result {
  std::filesystem::path archive;
  std::filesystem::path checksum_file;
  std::string sha256;
  std::size_t entry_count{ 0 };
};

inline constexpr std::time_t kArchiveMtime{ 315532800 };  // 1980-01-01, zip epoch

// Copy every required file into a fresh `stage_dir` laid out in canonical form.
// Caches (__pycache__, *.pyc) are left out.
void packager_stage(packager_inputs const &inputs, std::filesystem::path const &stage_dir);

// Entry names relative to `stage_dir`, '/' separated. Throws if a canonical path
// is missing.
package_manifest packager_collect(std::filesystem::path const &stage_dir,
                                  layout_cfg const &layout);

std::string packager_archive_name(layout_cfg const &layout, std::string const &version);

// Write the archive (sorted entries, fixed timestamps), re-open it and scan the
// stored names, then write "<hex>  <filename>" to <archive>.sha256.
package_result packager_write(package_manifest const &manifest,
                              std::filesystem::path const &archive_path);

// Throws pipeline_error (archive_structure) listing unsafe names stored in the
// archive.
void packager_scan_archive(std::filesystem::path const &archive_path);

std::string packager_checksum_line(std::string const &hex_digest,
                                   std::filesystem::path const &archive_path);

}  // namespace rtpack
