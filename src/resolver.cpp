#include "resolver.h"

#include "pipeline_error.h"
#include "smoke_probe.h"
#include "tui.h"
#include "util.h"

#include <algorithm>

namespace rtpack {
namespace {

constexpr char kPipShim[]{
  "import runpy, sys; sys.path.insert(0, sys.argv[1]); sys.argv = ['pip'] + sys.argv[2:]; "
  "runpy.run_module('pip', run_name='__main__', alter_sys=True)"
};

constexpr char kWheelSourceHint[]{
  "choose a different --wheel-source explicitly (official-cpu, "
  "official-accelerated-<tag>, an https URL or a local .whl); sources are never "
  "tried automatically"
};

std::vector<std::string> network_args(network_cfg const &network) {
  return { "--timeout",
           std::to_string(network.timeout.count()),
           "--retries",
           std::to_string(network.attempts),
           "--disable-pip-version-check",
           "--no-input" };
}

void append(std::vector<std::string> &dst, std::vector<std::string> const &src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

command_output run_pip(resolver_env const &env, std::vector<std::string> const &args) {
  return env.runner.run(resolver_pip_argv(env, args), command_options{});
}

std::string exit_description(command_output const &out) {
  return out.timed_out ? "timed out" : "exit " + std::to_string(out.exit_code);
}

// Wheel file names use '_' for '-'; compare normalized distribution names.
bool wheel_matches(std::string const &filename, std::string const &package) {
  if (!filename.ends_with(".whl")) { return false; }
  auto const dash{ filename.find('-') };
  if (dash == std::string::npos) { return false; }
  return requirement_normalize_name(filename.substr(0, dash)) ==
         requirement_normalize_name(package);
}

}  // namespace

std::vector<std::string> resolver_pip_argv(resolver_env const &env,
                                           std::vector<std::string> const &args) {
  std::vector<std::string> argv{ env.interpreter.string(),
                                 "-c",
                                 kPipShim,
                                 env.package_dir.string() };
  append(argv, args);
  return argv;
}

void resolver_bootstrap(resolver_env const &env,
                        std::optional<std::filesystem::path> const &bootstrap_script) {
  auto const probe{ smoke_probe_run(env.runner,
                                    env.interpreter,
                                    "pip",
                                    env.package_dir,
                                    env.network.timeout) };
  if (probe.status == probe_status::ok) {
    tui::debug("resolver: package manager already present");
    return;
  }

  if (!bootstrap_script) {
    throw pipeline_error(error_kind::dependency_install,
                         env.interpreter.string(),
                         "the embedded interpreter has no package manager (" +
                             std::string{ probe_status_name(probe.status) } + ")",
                         "configure ARTIFACTS.pip_bootstrap in rtpack.lua");
  }

  tui::info("Bootstrapping package manager into %s", env.package_dir.string().c_str());
  std::vector<std::string> argv{ env.interpreter.string(),
                                 bootstrap_script->string(),
                                 "--no-warn-script-location",
                                 "--target",
                                 env.package_dir.string() };
  append(argv, network_args(env.network));

  auto const out{ env.runner.run(argv, command_options{}) };
  if (!out.ok()) {
    throw pipeline_error(error_kind::dependency_install,
                         bootstrap_script->string(),
                         "package manager bootstrap failed (" + exit_description(out) + ")\n" +
                             out.tail(),
                         "check network access to the package index and retry");
  }
}

void resolver_preflight(resolver_env const &env, std::vector<requirement> const &bulk) {
  auto const dest{ env.scratch_dir / "preflight" };
  std::filesystem::create_directories(dest);

  std::vector<std::string> offending;
  std::string details;

  for (auto const &req : bulk) {
    std::vector<std::string> args{ "download",
                                   "--only-binary=:all:",
                                   "--no-deps",
                                   "--dest",
                                   dest.string() };
    if (env.interpreter_info.platform) {
      append(args,
             { "--platform",
               *env.interpreter_info.platform,
               "--python-version",
               env.interpreter_info.python_version });
    }
    append(args, network_args(env.network));
    args.push_back(req.line);

    auto const out{ run_pip(env, args) };
    if (out.ok()) {
      tui::debug("preflight: %s has a binary artifact", req.line.c_str());
      continue;
    }

    tui::error("preflight: no binary artifact for %s", req.line.c_str());
    offending.push_back(req.line);
    details += "\n--- " + req.line + " (" + exit_description(out) + ")\n" + out.tail(8);
  }

  if (!offending.empty()) {
    std::string subject;
    for (auto const &line : offending) { subject += (subject.empty() ? "" : ", ") + line; }
    throw pipeline_error(error_kind::dependency_preflight,
                         subject,
                         std::to_string(offending.size()) +
                             " requirement(s) have no binary-only artifact; nothing was "
                             "installed" + details,
                         "pin versions that publish wheels for this interpreter and "
                         "platform; source builds are not possible on the target host");
  }

  tui::info("Preflight passed for %zu requirement(s)", bulk.size());
}

void resolver_install_bulk(resolver_env const &env, std::vector<requirement> const &bulk) {
  if (bulk.empty()) { return; }

  std::string content;
  for (auto const &req : bulk) { content += req.line + "\n"; }
  auto const requirements_file{ env.scratch_dir / "bulk-requirements.txt" };
  util_write_file(requirements_file, content);

  std::vector<std::string> args{ "install",
                                 "--only-binary=:all:",
                                 "--no-warn-script-location",
                                 "--upgrade",
                                 "--target",
                                 env.package_dir.string(),
                                 "-r",
                                 requirements_file.string() };
  append(args, network_args(env.network));

  auto const out{ run_pip(env, args) };
  if (!out.ok()) {
    throw pipeline_error(error_kind::dependency_install,
                         requirements_file.string(),
                         "bulk install failed (" + exit_description(out) + ")\n" + out.tail(),
                         "rerun with --verbose for the full installer output");
  }
  tui::info("Installed %zu bulk requirement(s)", bulk.size());
}

void resolver_install_isolated(resolver_env const &env,
                               requirement const &isolated,
                               wheel_source const &source) {
  std::vector<std::string> args{ "install",
                                 "--only-binary=:all:",
                                 "--no-warn-script-location",
                                 "--upgrade",
                                 "--target",
                                 env.package_dir.string() };

  auto const from_index{ [&](std::string const &index_url) {
    append(args, { "--prefer-binary", "--extra-index-url", index_url, isolated.line });
  } };

  std::visit(match{
                 [&](wheel_source_cpu_index const &s) { from_index(s.index_url); },
                 [&](wheel_source_accelerated_index const &s) { from_index(s.index_url); },
                 [&](wheel_source_url const &s) { args.push_back(s.url); },
                 [&](wheel_source_local const &s) {
                   if (!wheel_matches(s.path.filename().string(), env.isolated.name)) {
                     throw pipeline_error(error_kind::dependency_install,
                                          s.path.string(),
                                          "local file is not a wheel of " + env.isolated.name,
                                          kWheelSourceHint);
                   }
                   args.push_back(s.path.string());
                 },
             },
             source);
  append(args, network_args(env.network));

  tui::info("Installing %s from %s",
            isolated.line.c_str(),
            wheel_source_describe(source).c_str());

  auto const out{ run_pip(env, args) };
  if (!out.ok()) {
    throw pipeline_error(error_kind::dependency_install,
                         isolated.line,
                         "install from " + wheel_source_describe(source) + " failed (" +
                             exit_description(out) + ")\n" + out.tail(),
                         kWheelSourceHint);
  }
}

void resolver_smoke_test(resolver_env const &env) {
  auto const probe{ smoke_probe_run(env.runner,
                                    env.interpreter,
                                    env.isolated.module,
                                    env.package_dir,
                                    env.network.timeout) };
  if (probe.status == probe_status::ok) {
    tui::info("Smoke test passed: import %s", env.isolated.module.c_str());
    return;
  }

  throw pipeline_error(error_kind::smoke_test,
                       env.isolated.module,
                       std::string{ "smoke test failed: " } + probe_status_name(probe.status) +
                           "\n" + probe.output,
                       probe_status_hint(probe.status, env.isolated.module));
}

void resolver_run(resolver_env const &env,
                  dependency_closure const &closure,
                  wheel_source const &source,
                  std::optional<std::filesystem::path> const &bootstrap_script) {
  std::filesystem::create_directories(env.package_dir);
  std::filesystem::create_directories(env.scratch_dir);

  auto const isolated{ closure.isolated.value_or(
      requirement{ .line = env.isolated.name,
                   .name = requirement_normalize_name(env.isolated.name) }) };

  resolver_bootstrap(env, bootstrap_script);
  resolver_preflight(env, closure.bulk);
  resolver_install_bulk(env, closure.bulk);
  resolver_install_isolated(env, isolated, source);
  resolver_smoke_test(env);
}

}  // namespace rtpack
