#include "cmd_build.h"

#include "command_runner.h"
#include "fetch.h"
#include "manifest.h"
#include "packager.h"
#include "pipeline.h"
#include "platform.h"
#include "prerequisite.h"
#include "tui.h"
#include "verifier.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>

namespace rtpack {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Assemble, package and verify the runtime bundle") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  cfg_ptr->wheel_source = kWheelSourceDefault;

  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to rtpack.lua manifest");
  sub->add_option("--app-repo",
                  cfg_ptr->app_repo,
                  "Application repository (requirements, launcher, config template)");
  sub->add_option("--wheel-source",
                  cfg_ptr->wheel_source,
                  "official-cpu, official-accelerated-<tag>, a wheel URL or a local wheel")
      ->capture_default_str();
  sub->add_option("--version", cfg_ptr->version, "Bundle version (semver) for the archive name");
  sub->add_flag("--skip-verify", cfg_ptr->skip_verify, "Do not verify the produced archive");
  sub->add_option("--work-dir",
                  cfg_ptr->work_dir,
                  "Work directory; deleted at the start of every build");
  sub->add_option("--output-dir", cfg_ptr->output_dir, "Directory receiving the archive");
  sub->add_option("--cache-root", cfg_ptr->cache_root, "Download cache root directory");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

bool cmd_build::execute() {
  auto const manifest_path{ manifest::find_manifest_path(cfg_.manifest_path) };
  auto const m{ manifest::load(manifest_path) };
  auto const manifest_dir{ manifest_path.parent_path() };

  auto const app_repo{ cfg_.app_repo ? cfg_.app_repo : m->app_repo };
  if (!app_repo) {
    throw std::runtime_error("build: no application repository (pass --app-repo or set APP.repo)");
  }

  auto cache_root{ cfg_.cache_root ? cfg_.cache_root : cli_cache_root_ };
  if (!cache_root) { cache_root = platform::get_default_cache_root(); }
  if (!cache_root) {
    tui::warn("Download cache disabled: none of %s is set",
              platform::get_default_cache_root_env_vars());
  }

  process_command_runner runner;
  libcurl_transport primary;
  command_transport secondary{ runner };
  fetcher fetch{ { &primary, &secondary },
                 fetch_policy{ .attempts = m->network.attempts,
                               .timeout = m->network.timeout,
                               .retry_delay = std::chrono::milliseconds{ 2000 } },
                 cache_root,
                 manifest_dir };

  std::optional<filesystem_prerequisite_host> host;
  if (m->prerequisite) { host.emplace(m->prerequisite->marker, runner); }

  pipeline_options const options{
    .app_repo = *app_repo,
    .wheel_source_token = cfg_.wheel_source,
    .version_override = cfg_.version,
    .work_dir = cfg_.work_dir.value_or(manifest_dir / "build" / "work"),
    .output_dir = cfg_.output_dir.value_or(manifest_dir / "dist"),
  };

  auto ctx{ pipeline_prepare(*m,
                             options,
                             pipeline_services{ .runner = runner,
                                                .fetch = fetch,
                                                .prerequisite = host ? &*host : nullptr }) };
  tui::info("Building %s %s with %s",
            m->layout.archive_basename.c_str(),
            ctx.version.c_str(),
            wheel_source_describe(ctx.wheels).c_str());

  auto const outcome{ pipeline_build(ctx) };
  if (outcome.error) {
    tui::error("%s", outcome.error->what());
    tui::error("No archive was produced; fix the cause and rerun (the build starts clean)");
    return false;
  }

  auto const &package{ *ctx.package };
  tui::print_stdout("%s", packager_checksum_line(package.sha256, package.archive).c_str());

  if (cfg_.skip_verify) {
    tui::warn("Verification skipped (--skip-verify)");
    return true;
  }

  auto const result{ verifier_run(package.archive, verify_options_from(*m), runner) };
  tui::print_stdout("%s", result.report.render().c_str());

  if (result.outcome == verify_outcome::passed) { return true; }

  auto const *first{ result.report.first_failure() };
  pipeline_error const err{ error_kind::structural_verification,
                            first ? first->name : package.archive.string(),
                            result.error.empty() ? verify_outcome_name(result.outcome)
                                                 : result.error,
                            "do not ship " + package.archive.filename().string() +
                                "; inspect the extracted tree and rebuild" };
  tui::error("%s", err.what());
  if (result.extracted_dir) {
    tui::error("Extracted tree kept at %s", result.extracted_dir->string().c_str());
  }
  return false;
}

}  // namespace rtpack
