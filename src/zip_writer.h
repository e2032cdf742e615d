#pragma once

#include "util.h"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

struct archive;

namespace rtpack {

// Streams entries into a new zip file. Entry names are written exactly as given;
// callers own name validation and ordering.
class zip_writer : unmovable {
 public:
  zip_writer(std::filesystem::path const &output, std::time_t mtime);
  ~zip_writer();

  void add_directory(std::string const &name);
  void add_file(std::string const &name, std::filesystem::path const &source);
  void add_bytes(std::string const &name, std::string_view content, int mode = 0644);

  // Flushes the central directory. Destruction without close() leaves a truncated file.
  void close();

 private:
  void write_header(std::string const &name, int filetype, int mode, std::int64_t size);

  archive *handle_{ nullptr };
  std::filesystem::path output_;
  std::time_t mtime_;
  bool closed_{ false };
};

}  // namespace rtpack
