#include "pipeline.h"

#include "extract.h"
#include "pth_patch.h"
#include "requirements.h"
#include "resolver.h"
#include "tui.h"
#include "uri.h"
#include "version.h"

#include <chrono>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace rtpack {
namespace {

std::string artifact_filename(artifact_cfg const &artifact, char const *fallback) {
  auto name{ uri_extract_filename(artifact.source) };
  return name.empty() ? std::string{ fallback } : name;
}

void require_app_file(std::filesystem::path const &file, char const *what) {
  if (std::filesystem::is_regular_file(file)) { return; }
  throw pipeline_error(error_kind::config,
                       file.string(),
                       std::string{ what } + " not found in the application repository",
                       "pass --app-repo pointing at the application checkout, or fix "
                       "LAYOUT/DEPENDENCIES in rtpack.lua");
}

std::filesystem::path comparable(std::filesystem::path const &p) {
  std::error_code ec;
  auto resolved{ std::filesystem::weakly_canonical(std::filesystem::absolute(p), ec) };
  if (ec) { resolved = std::filesystem::absolute(p); }
  auto normal{ resolved.lexically_normal() };
  if (!normal.has_filename() && normal != normal.root_path()) { normal = normal.parent_path(); }
  return normal;
}

// True when `inner` is `outer` or lies below it, compared component by component.
bool path_within(std::filesystem::path const &inner, std::filesystem::path const &outer) {
  auto const a{ comparable(inner) };
  auto const b{ comparable(outer) };
  auto it{ a.begin() };
  for (auto const &part : b) {
    if (it == a.end() || *it != part) { return false; }
    ++it;
  }
  return true;
}

// The work directory is deleted wholesale; it must not hold any input or output.
void require_disposable_work_dir(std::filesystem::path const &work_dir,
                                 std::filesystem::path const &app_repo,
                                 std::filesystem::path const &output_dir,
                                 std::filesystem::path const &manifest_path) {
  std::vector<std::pair<char const *, std::filesystem::path>> protected_dirs{
    { "the application repository", app_repo },
    { "the output directory", output_dir },
    { "the current directory", std::filesystem::current_path() },
  };
  if (!manifest_path.empty()) {
    protected_dirs.emplace_back("the manifest directory", manifest_path.parent_path());
  }
  if (char const *home{ std::getenv("HOME") }) {
    protected_dirs.emplace_back("the home directory", home);
  }

  bool const is_root{ comparable(work_dir) == comparable(work_dir).root_path() };
  for (auto const &[what, dir] : protected_dirs) {
    if (!is_root && !path_within(dir, work_dir)) { continue; }
    throw pipeline_error(error_kind::config,
                         work_dir.string(),
                         std::string{ "work directory contains " } + what + " (" +
                             dir.string() + ")",
                         "pass a dedicated --work-dir; it is deleted at the start of each build");
  }
}

// Reject archives with absolute-like names before anything is written.
void require_safe_entries(std::filesystem::path const &archive, std::string const &name) {
  std::string unsafe;
  for (auto const &entry : extract_list_entries(archive)) {
    if (!extract_entry_name_is_safe(entry)) { unsafe += (unsafe.empty() ? "" : ", ") + entry; }
  }
  if (unsafe.empty()) { return; }

  throw pipeline_error(error_kind::integrity,
                       archive.string(),
                       "distribution '" + name + "' contains unsafe entry names: " + unsafe,
                       "use the official distribution archive for " + name);
}

std::filesystem::path fetch_distribution(pipeline_context &ctx,
                                         char const *name,
                                         artifact_cfg const &artifact,
                                         std::filesystem::path const &extract_to) {
  auto const downloaded{ ctx.services.fetch.fetch(artifact_spec{
      .name = name,
      .source = artifact.source,
      .destination = ctx.downloads_dir() / artifact_filename(artifact, name),
      .sha256 = artifact.sha256,
      .archive = artifact.archive }) };

  if (!artifact.archive) {
    std::filesystem::create_directories(extract_to);
    auto const target{ extract_to / downloaded.destination.filename() };
    std::filesystem::copy_file(downloaded.destination,
                               target,
                               std::filesystem::copy_options::overwrite_existing);
    return extract_to;
  }

  require_safe_entries(downloaded.destination, name);

  std::filesystem::remove_all(extract_to);
  auto const files{ extract(downloaded.destination,
                            extract_to,
                            extract_options{ .strip_components = artifact.strip_components,
                                             .skip_unsafe = false }) };
  tui::info("Extracted %s: %llu files -> %s",
            name,
            static_cast<unsigned long long>(files),
            extract_to.string().c_str());
  return extract_to;
}

std::filesystem::path fetch_single(pipeline_context &ctx,
                                   char const *name,
                                   artifact_cfg const &artifact) {
  return ctx.services.fetch
      .fetch(artifact_spec{ .name = name,
                            .source = artifact.source,
                            .destination =
                                ctx.downloads_dir() / artifact_filename(artifact, name),
                            .sha256 = artifact.sha256,
                            .archive = artifact.archive })
      .destination;
}

}  // namespace

std::filesystem::path pipeline_context::interpreter_dir() const {
  return runtime_dir() / cfg.layout.interpreter_dir;
}

std::filesystem::path pipeline_context::interpreter_binary() const {
  return interpreter_dir() / cfg.layout.interpreter_binary;
}

std::filesystem::path pipeline_context::package_dir() const {
  return interpreter_dir() / cfg.dependencies.package_dir;
}

pipeline_context pipeline_prepare(manifest const &cfg,
                                  pipeline_options const &options,
                                  pipeline_services services) {
  auto const app_repo{ std::filesystem::absolute(options.app_repo).lexically_normal() };
  if (!std::filesystem::is_directory(app_repo)) {
    throw pipeline_error(error_kind::config,
                         app_repo.string(),
                         "application repository does not exist",
                         "pass --app-repo or set APP.repo in rtpack.lua");
  }
  require_app_file(app_repo / cfg.dependencies.requirements, "requirements file");
  require_app_file(app_repo / cfg.layout.launcher, "launcher");
  require_app_file(app_repo / cfg.layout.config_template, "runtime config template");

  if (cfg.prerequisite && !services.prerequisite) {
    throw pipeline_error(error_kind::config,
                         "PREREQUISITE",
                         "a prerequisite is configured but no host check is available",
                         "remove PREREQUISITE from rtpack.lua or run on the target host");
  }

  auto wheels{ wheel_source_parse(options.wheel_source_token, cfg.wheel_index, app_repo) };
  auto version{ version_resolve(options.version_override, app_repo) };

  auto const work_dir{ std::filesystem::absolute(options.work_dir).lexically_normal() };
  auto const output_dir{ std::filesystem::absolute(options.output_dir).lexically_normal() };
  require_disposable_work_dir(work_dir, app_repo, output_dir, cfg.manifest_path);

  tui::info("Clean build in %s", work_dir.string().c_str());
  std::filesystem::remove_all(work_dir);
  std::filesystem::create_directories(work_dir);

  return pipeline_context{
    .cfg = cfg,
    .app_repo = app_repo,
    .wheels = std::move(wheels),
    .version = std::move(version),
    .work_dir = work_dir,
    .output_dir = output_dir,
    .services = services,
    .bootstrap_script = std::nullopt,
    .prerequisite_installer = std::nullopt,
    .package = std::nullopt,
  };
}

stage_result pipeline_run_stage(std::string const &name,
                                error_kind fallback,
                                std::function<std::filesystem::path()> const &body) {
  auto const start{ std::chrono::steady_clock::now() };
  tui::info("==> %s", name.c_str());

  try {
    auto path{ body() };
    auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count() };
    tui::debug("stage %s finished in %lld ms", name.c_str(), static_cast<long long>(ms));
    return stage_output{ .stage = name, .path = std::move(path) };
  } catch (pipeline_error const &err) {
    return err;
  } catch (std::exception const &ex) {
    return pipeline_error(fallback,
                          name,
                          ex.what(),
                          "rerun with --verbose for details; the next build starts clean");
  }
}

std::filesystem::path pipeline_stage_fetch(pipeline_context &ctx) {
  auto const &cfg{ ctx.cfg };
  std::filesystem::create_directories(ctx.downloads_dir());

  fetch_distribution(ctx, "interpreter", cfg.interpreter_artifact, ctx.interpreter_dir());
  fetch_distribution(ctx,
                     "vcs",
                     cfg.vcs_artifact,
                     ctx.runtime_dir() / cfg.layout.vcs_dir);

  if (cfg.pip_bootstrap) {
    ctx.bootstrap_script = fetch_single(ctx, "pip_bootstrap", *cfg.pip_bootstrap);
  }

  if (cfg.prerequisite && cfg.prerequisite_installer) {
    auto installer{ fetch_single(ctx, "prerequisite", *cfg.prerequisite_installer) };
    std::filesystem::permissions(installer,
                                 std::filesystem::perms::owner_exec |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::add);
    ctx.prerequisite_installer = std::move(installer);
  }

  return ctx.runtime_dir();
}

std::filesystem::path pipeline_stage_resolve(pipeline_context &ctx) {
  auto const &deps{ ctx.cfg.dependencies };

  if (!std::filesystem::is_regular_file(ctx.interpreter_binary())) {
    throw pipeline_error(error_kind::dependency_install,
                         ctx.interpreter_binary().string(),
                         "interpreter binary missing after extraction",
                         "check LAYOUT.interpreter_binary and ARTIFACTS.interpreter.strip");
  }

  auto const closure{ requirements_load(ctx.app_repo / deps.requirements, deps.isolated.name) };
  tui::info("Resolving %zu requirement(s) plus %s from %s",
            closure.bulk.size(),
            deps.isolated.name.c_str(),
            wheel_source_describe(ctx.wheels).c_str());

  std::filesystem::create_directories(ctx.package_dir());
  std::filesystem::create_directories(ctx.scratch_dir());

  resolver_env const env{ .interpreter = ctx.interpreter_binary(),
                          .package_dir = ctx.package_dir(),
                          .scratch_dir = ctx.scratch_dir(),
                          .interpreter_info = ctx.cfg.interpreter,
                          .isolated = deps.isolated,
                          .network = ctx.cfg.network,
                          .runner = ctx.services.runner };
  resolver_run(env, closure, ctx.wheels, ctx.bootstrap_script);
  return ctx.package_dir();
}

std::filesystem::path pipeline_stage_patch(pipeline_context &ctx) {
  return pth_patch(ctx.interpreter_dir(), ctx.cfg.interpreter, ctx.cfg.dependencies.package_dir);
}

std::filesystem::path pipeline_stage_prerequisite(pipeline_context &ctx) {
  if (!ctx.cfg.prerequisite) {
    tui::info("No prerequisite configured");
    return {};
  }

  auto const &cfg{ *ctx.cfg.prerequisite };
  if (!ctx.prerequisite_installer) {
    throw pipeline_error(error_kind::prerequisite_install,
                         cfg.name,
                         "installer was not fetched",
                         "define ARTIFACTS.prerequisite in rtpack.lua");
  }

  auto const outcome{ prerequisite_ensure(cfg,
                                          *ctx.prerequisite_installer,
                                          *ctx.services.prerequisite) };
  tui::info("%s: %s", cfg.name.c_str(), prerequisite_outcome_name(outcome));
  return cfg.marker;
}

std::filesystem::path pipeline_stage_package(pipeline_context &ctx) {
  auto const &layout{ ctx.cfg.layout };
  packager_stage(packager_inputs{ .runtime_dir = ctx.runtime_dir(),
                                  .launcher = ctx.app_repo / layout.launcher,
                                  .config_template = ctx.app_repo / layout.config_template,
                                  .layout = layout },
                 ctx.stage_dir());

  auto const contents{ packager_collect(ctx.stage_dir(), layout) };
  ctx.package = packager_write(contents,
                               ctx.output_dir / packager_archive_name(layout, ctx.version));
  return ctx.package->archive;
}

build_outcome pipeline_build(pipeline_context &ctx) {
  struct stage_def {
    char const *name;
    error_kind fallback;
    std::filesystem::path (*body)(pipeline_context &);
  };

  stage_def const stages[]{
    { "fetch", error_kind::download, &pipeline_stage_fetch },
    { "resolve", error_kind::dependency_install, &pipeline_stage_resolve },
    { "patch", error_kind::patch_invariant, &pipeline_stage_patch },
    { "prerequisite", error_kind::prerequisite_install, &pipeline_stage_prerequisite },
    { "package", error_kind::archive_structure, &pipeline_stage_package },
  };

  build_outcome outcome;
  for (auto const &stage : stages) {
    auto result{ pipeline_run_stage(stage.name, stage.fallback, [&] {
      return stage.body(ctx);
    }) };

    if (auto *err{ std::get_if<pipeline_error>(&result) }) {
      outcome.error = std::move(*err);
      return outcome;
    }
    outcome.completed.push_back(std::get<stage_output>(std::move(result)));
  }
  return outcome;
}

}  // namespace rtpack
