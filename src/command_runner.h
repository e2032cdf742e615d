#pragma once

#include "util.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rtpack {

struct command_options {
  std::optional<std::filesystem::path> cwd;
  std::optional<std::chrono::milliseconds> timeout;
};

struct command_output {
  int exit_code{ 0 };
  bool timed_out{ false };
  std::vector<std::string> lines;  // merged stdout/stderr

  bool ok() const { return exit_code == 0 && !timed_out; }
  std::string tail(std::size_t max_lines = 20) const;
};

// Seam between stages and the subprocesses they drive (pip, interpreter probes,
// installers). Stages never fork directly.
class command_runner : unmovable {
 public:
  virtual ~command_runner() = default;
  virtual command_output run(std::vector<std::string> const &argv,
                             command_options const &options) = 0;

 protected:
  command_runner() = default;
};

class process_command_runner : public command_runner {
 public:
  command_output run(std::vector<std::string> const &argv,
                     command_options const &options) override;
};

}  // namespace rtpack
