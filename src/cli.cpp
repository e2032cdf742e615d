#include "cli.h"

#include "CLI11.hpp"

#include <string>

namespace rtpack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "rtpack - relocatable runtime bundle builder" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  std::optional<std::filesystem::path> cache_root;
  app.add_option("--cache-root", cache_root, "Download cache root directory");

  // -v / --version trigger the version command directly.
  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const select{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_build::register_cli(app, select);
  cmd_verify::register_cli(app, select);
  cmd_hash::register_cli(app, select);
  cmd_version::register_cli(app, select);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  args.cache_root = cache_root;
  args.verbosity = verbose ? tui::level::TUI_DEBUG : tui::level::TUI_INFO;
  args.decorated_logging = verbose;

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg && args.cli_output.empty()) {
    args.cmd_cfg = std::move(cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace rtpack
