#pragma once

#include "cmds/cmd_build.h"
#include "cmds/cmd_hash.h"
#include "cmds/cmd_verify.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace rtpack {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_build::cfg, cmd_verify::cfg, cmd_hash::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> cache_root;  // Global cache root override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace rtpack
