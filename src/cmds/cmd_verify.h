#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace rtpack {

class cmd_verify : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_verify> {
    std::filesystem::path archive_path;
    std::optional<std::filesystem::path> manifest_path;
    bool keep{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_verify(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace rtpack
