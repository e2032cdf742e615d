#include "zip_writer.h"

#include "archive.h"
#include "archive_entry.h"

#include <memory>
#include <stdexcept>
#include <vector>

#include <sys/stat.h>

namespace rtpack {
namespace {

struct entry_deleter {
  void operator()(archive_entry *e) const noexcept { archive_entry_free(e); }
};

}  // namespace

zip_writer::zip_writer(std::filesystem::path const &output, std::time_t mtime)
    : handle_{ archive_write_new() }, output_{ output }, mtime_{ mtime } {
  if (!handle_) { throw std::runtime_error("archive_write_new failed"); }

  if (archive_write_set_format_zip(handle_) != ARCHIVE_OK ||
      archive_write_open_filename(handle_, output.c_str()) != ARCHIVE_OK) {
    std::string const msg{ "Failed to create zip " + output.string() + ": " +
                           archive_error_string(handle_) };
    archive_write_free(handle_);
    handle_ = nullptr;
    throw std::runtime_error(msg);
  }
}

zip_writer::~zip_writer() {
  if (handle_) { archive_write_free(handle_); }
}

void zip_writer::write_header(std::string const &name,
                              int filetype,
                              int mode,
                              std::int64_t size) {
  std::unique_ptr<archive_entry, entry_deleter> entry{ archive_entry_new() };
  if (!entry) { throw std::runtime_error("archive_entry_new failed"); }

  archive_entry_set_pathname(entry.get(), name.c_str());
  archive_entry_set_filetype(entry.get(), static_cast<unsigned>(filetype));
  archive_entry_set_perm(entry.get(), static_cast<mode_t>(mode));
  archive_entry_set_size(entry.get(), size);
  archive_entry_set_mtime(entry.get(), mtime_, 0);

  if (archive_write_header(handle_, entry.get()) != ARCHIVE_OK) {
    throw std::runtime_error("Failed to write zip entry header " + name + ": " +
                             archive_error_string(handle_));
  }
}

void zip_writer::add_directory(std::string const &name) {
  write_header(name.ends_with('/') ? name : name + "/", AE_IFDIR, 0755, 0);
}

void zip_writer::add_file(std::string const &name, std::filesystem::path const &source) {
  auto file{ util_open_file(source, "rb") };
  if (!file) { throw std::runtime_error("zip_writer: failed to open " + source.string()); }

  struct stat st {};
  if (::stat(source.c_str(), &st) != 0) {
    throw std::runtime_error("zip_writer: failed to stat " + source.string());
  }

  write_header(name, AE_IFREG, static_cast<int>(st.st_mode & 0777), st.st_size);

  std::vector<char> buffer(1024 * 1024);
  size_t n{ 0 };
  while ((n = std::fread(buffer.data(), 1, buffer.size(), file.get())) > 0) {
    if (archive_write_data(handle_, buffer.data(), n) < 0) {
      throw std::runtime_error("Failed to write zip entry data " + name + ": " +
                               archive_error_string(handle_));
    }
  }
  if (std::ferror(file.get())) {
    throw std::runtime_error("zip_writer: read failed: " + source.string());
  }
}

void zip_writer::add_bytes(std::string const &name, std::string_view content, int mode) {
  write_header(name, AE_IFREG, mode, static_cast<std::int64_t>(content.size()));
  if (!content.empty() && archive_write_data(handle_, content.data(), content.size()) < 0) {
    throw std::runtime_error("Failed to write zip entry data " + name + ": " +
                             archive_error_string(handle_));
  }
}

void zip_writer::close() {
  if (closed_) { return; }
  closed_ = true;
  if (archive_write_close(handle_) != ARCHIVE_OK) {
    throw std::runtime_error("Failed to finalize zip " + output_.string() + ": " +
                             archive_error_string(handle_));
  }
}

}  // namespace rtpack
