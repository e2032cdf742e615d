#include "extract.h"

#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace rtpack {
namespace {

struct archive_reader : unmovable {
  explicit archive_reader(std::filesystem::path const &path) : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_all(handle);

    if (archive_read_open_filename(handle, path.c_str(), 10240) != ARCHIVE_OK) {
      std::string const msg{ "Failed to open archive " + path.string() + ": " +
                             archive_error_string(handle) };
      archive_read_free(handle);
      handle = nullptr;
      throw std::runtime_error(msg);
    }
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  // Returns false at end of archive.
  bool next(archive_entry *&entry) {
    int const r{ archive_read_next_header(handle, &entry) };
    if (r == ARCHIVE_EOF) { return false; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to read archive header: ") +
                               archive_error_string(handle));
    }
    return true;
  }

  archive *handle{ nullptr };
};

struct archive_disk_writer : unmovable {
  archive_disk_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_disk_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

std::optional<std::string> strip_path_components(std::string_view path, int strip_count) {
  while (!path.empty() && path.front() == '/') { path.remove_prefix(1); }

  for (int stripped{ 0 }; stripped < strip_count; ++stripped) {
    auto const slash{ path.find('/') };
    if (slash == std::string_view::npos) { return std::nullopt; }
    path.remove_prefix(slash + 1);
    while (!path.empty() && path.front() == '/') { path.remove_prefix(1); }
  }

  if (path.empty()) { return std::nullopt; }
  return std::string{ path };
}

}  // namespace

bool extract_entry_name_is_safe(std::string_view name) {
  if (name.empty()) { return false; }
  if (name.front() == '/' || name.front() == '\\') { return false; }
  if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) &&
      name[1] == ':') {
    return false;
  }

  size_t start{ 0 };
  while (start <= name.size()) {
    auto const end{ name.find_first_of("/\\", start) };
    auto const segment{ name.substr(start,
                                     end == std::string_view::npos ? std::string_view::npos
                                                                   : end - start) };
    if (segment == "..") { return false; }
    if (end == std::string_view::npos) { break; }
    start = end + 1;
  }
  return true;
}

std::vector<std::string> extract_list_entries(std::filesystem::path const &archive_path) {
  archive_reader reader{ archive_path };

  std::vector<std::string> names;
  archive_entry *entry{ nullptr };
  while (reader.next(entry)) {
    char const *name{ archive_entry_pathname(entry) };
    names.emplace_back(name ? name : "");
    archive_read_data_skip(reader.handle);
  }
  return names;
}

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  archive_reader reader{ archive_path };
  archive_disk_writer writer;

  archive_entry *entry{ nullptr };
  std::uint64_t files_extracted{ 0 };

  while (reader.next(entry)) {
    char const *raw_path{ archive_entry_pathname(entry) };
    if (!raw_path) { throw std::runtime_error("Archive entry has null pathname"); }

    if (!extract_entry_name_is_safe(raw_path)) {
      if (!options.skip_unsafe) {
        throw std::runtime_error("Unsafe archive entry in " + archive_path.string() + ": " +
                                 raw_path);
      }
      tui::warn("extract: skipping unsafe entry %s", raw_path);
      archive_read_data_skip(reader.handle);
      continue;
    }

    auto const entry_path{ strip_path_components(raw_path, options.strip_components) };
    if (!entry_path) { continue; }

    std::filesystem::path const full_path{ destination / *entry_path };
    if (auto const dir{ full_path.parent_path() }; !dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(dir, ec);
      if (ec) {
        throw std::runtime_error("Failed to create directory " + dir.string() + ": " +
                                 ec.message());
      }
    }
    archive_entry_copy_pathname(entry, full_path.c_str());

    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      auto const target{ strip_path_components(hardlink, options.strip_components) };
      if (target) { archive_entry_copy_hardlink(entry, (destination / *target).c_str()); }
    }

    if (int const r{ archive_write_header(writer.handle, entry) };
        r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };

    if (archive_entry_size(entry) > 0) {
      std::vector<char> buffer(1024 * 1024);
      la_ssize_t bytes_read{ 0 };
      while ((bytes_read = archive_read_data(reader.handle, buffer.data(), buffer.size())) >
             0) {
        if (archive_write_data(writer.handle, buffer.data(), static_cast<size_t>(bytes_read)) <
            0) {
          throw std::runtime_error(std::string("Failed to write entry data: ") +
                                   archive_error_string(writer.handle));
        }
      }
      if (bytes_read < 0) {
        throw std::runtime_error(std::string("Failed to read entry data: ") +
                                 archive_error_string(reader.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish entry: ") +
                               archive_error_string(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (files_extracted == 0) {
    throw std::runtime_error("Archive extraction failed: 0 files extracted from " +
                             archive_path.filename().string() +
                             " (archive may be empty, corrupt, or unsupported format)");
  }

  tui::debug("extract: %llu files from %s into %s",
             static_cast<unsigned long long>(files_extracted),
             archive_path.filename().string().c_str(),
             destination.string().c_str());
  return files_extracted;
}

}  // namespace rtpack
