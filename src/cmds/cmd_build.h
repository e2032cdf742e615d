#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace rtpack {

class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    std::optional<std::filesystem::path> manifest_path;
    std::optional<std::filesystem::path> app_repo;
    std::string wheel_source;
    std::optional<std::string> version;
    std::optional<std::filesystem::path> work_dir;
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::filesystem::path> cache_root;
    bool skip_verify{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_build(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace rtpack
