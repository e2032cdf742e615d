#pragma once

#include "command_runner.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rtpack {

// Exit codes of the import probe script.
inline constexpr int kProbeExitOk{ 0 };
inline constexpr int kProbeExitNotFound{ 3 };
inline constexpr int kProbeExitLoadFailed{ 4 };

enum class probe_status {
  ok,
  not_installed,  // module cannot be located
  load_failed,    // located, but importing raised
  probe_failed,   // interpreter did not run the probe (crash, timeout, spawn error)
};

struct probe_result {
  probe_status status;
  int exit_code;
  std::string output;  // last lines of interpreter output
};

// Import `module` in a fresh interpreter. When `extra_path` is set it is put in
// front of sys.path first.
probe_result smoke_probe_run(command_runner &runner,
                             std::filesystem::path const &interpreter,
                             std::string const &module,
                             std::optional<std::filesystem::path> const &extra_path,
                             std::chrono::seconds timeout);

char const *probe_status_name(probe_status status);

// Remediation text for a failed probe.
std::string probe_status_hint(probe_status status, std::string_view module);

}  // namespace rtpack
