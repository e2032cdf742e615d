#include "cli.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  rtpack::tui::init();
  rtpack::termination_handler_install();

  auto args{ rtpack::cli_parse(argc, argv) };
  rtpack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      rtpack::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    rtpack::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  bool ok{ false };
  try {
    rtpack::libgit2_scope git_guard;

    auto cmd{ std::visit(
        [&](auto const &cfg) { return rtpack::cmd::create(cfg, args.cache_root); },
        *args.cmd_cfg) };

    ok = cmd->execute();
  } catch (std::exception const &ex) {
    rtpack::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
