#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct process_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
};

struct process_run_cfg {
  std::function<void(std::string_view)> on_output_line;  // stdout and stderr, by line
  std::optional<std::filesystem::path> cwd;
  std::optional<std::chrono::milliseconds> timeout;  // child is SIGKILLed on expiry
};

// Run argv[0] (resolved against PATH when it has no separator) with stdin bound to
// /dev/null and the parent environment. Throws if the executable cannot be found or
// the child cannot be spawned.
process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg);

}  // namespace rtpack
