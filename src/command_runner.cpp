#include "command_runner.h"

#include "process.h"
#include "tui.h"

#include <exception>
#include <string>

namespace rtpack {

std::string command_output::tail(std::size_t max_lines) const {
  std::size_t const first{ lines.size() > max_lines ? lines.size() - max_lines : 0 };

  std::string result;
  for (std::size_t i{ first }; i < lines.size(); ++i) {
    result += "  | ";
    result += lines[i];
    result += '\n';
  }
  return result;
}

command_output process_command_runner::run(std::vector<std::string> const &argv,
                                           command_options const &options) {
  std::string flattened;
  for (auto const &arg : argv) {
    if (!flattened.empty()) { flattened.push_back(' '); }
    flattened += arg;
  }
  tui::debug("run: %s", flattened.c_str());

  command_output output;
  process_run_cfg const cfg{ .on_output_line =
                                 [&output](std::string_view line) {
                                   output.lines.emplace_back(line);
                                   tui::debug("  | %.*s",
                                              static_cast<int>(line.size()),
                                              line.data());
                                 },
                             .cwd = options.cwd,
                             .timeout = options.timeout };

  try {
    auto const result{ process_run(argv, cfg) };
    output.exit_code = result.exit_code;
    output.timed_out = result.timed_out;
  } catch (std::exception const &e) {
    // Spawn failures (missing executable) look like a failed command to callers.
    output.exit_code = 127;
    output.lines.emplace_back(e.what());
  }

  return output;
}

}  // namespace rtpack
