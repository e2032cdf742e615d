#include "cmd_verify.h"

#include "command_runner.h"
#include "manifest.h"
#include "tui.h"
#include "verifier.h"

#include "CLI11.hpp"

#include <memory>

namespace rtpack {

void cmd_verify::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("verify", "Extract a runtime archive and check it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("archive", cfg_ptr->archive_path, "Runtime archive (.zip)")->required();
  sub->add_option("--manifest",
                  cfg_ptr->manifest_path,
                  "Path to rtpack.lua manifest (layout and expected versions)");
  sub->add_flag("--keep", cfg_ptr->keep, "Keep the extracted tree after a passing run");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_verify::cmd_verify(cmd_verify::cfg cfg,
                       std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_verify::execute() {
  verify_options options;

  std::optional<std::filesystem::path> manifest_path;
  if (cfg_.manifest_path) {
    manifest_path = manifest::find_manifest_path(cfg_.manifest_path);
  } else {
    manifest_path = manifest::discover();
  }

  if (manifest_path) {
    options = verify_options_from(*manifest::load(*manifest_path));
  } else {
    tui::warn("No rtpack.lua found; verifying against the default layout");
  }
  options.keep = cfg_.keep;

  process_command_runner runner;
  auto const result{ verifier_run(cfg_.archive_path, options, runner) };

  switch (result.outcome) {
    case verify_outcome::archive_not_found:
    case verify_outcome::extraction_failed:
      tui::error("%s: %s", verify_outcome_name(result.outcome), result.error.c_str());
      if (result.extracted_dir) {
        tui::error("Partial extraction kept at %s", result.extracted_dir->string().c_str());
      }
      return false;
    case verify_outcome::passed:
    case verify_outcome::checks_failed: break;
  }

  tui::print_stdout("%s", result.report.render().c_str());
  if (result.extracted_dir) {
    tui::info("Extracted tree: %s", result.extracted_dir->string().c_str());
  }

  if (result.outcome == verify_outcome::checks_failed) {
    tui::error("Verification failed: %zu check(s) failed", result.report.failure_count());
    return false;
  }
  return true;
}

}  // namespace rtpack
