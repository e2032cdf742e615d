#include "cmd_hash.h"

#include "sha256.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>

namespace rtpack {

void cmd_hash::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("hash", "Print the SHA-256 of a file, for pinning in rtpack.lua") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("file", cfg_ptr->file_path, "File to hash")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_hash::cmd_hash(cmd_hash::cfg cfg,
                   std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_hash::execute() {
  if (!std::filesystem::is_regular_file(cfg_.file_path)) {
    throw std::runtime_error("hash: not a regular file: " + cfg_.file_path.string());
  }

  auto const hex{ sha256_hex(cfg_.file_path) };
  tui::debug("hash: %s (%s)",
             cfg_.file_path.string().c_str(),
             util_format_bytes(std::filesystem::file_size(cfg_.file_path)).c_str());
  tui::print_stdout("%s\n", hex.c_str());
  return true;
}

}  // namespace rtpack
