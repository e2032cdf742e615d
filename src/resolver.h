#pragma once

#include "command_runner.h"
#include "manifest.h"
#include "requirements.h"
#include "wheel_source.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rtpack {

struct resolver_env {
  std::filesystem::path interpreter;    // embedded interpreter binary
  std::filesystem::path package_dir;    // install target (site-packages)
  std::filesystem::path scratch_dir;    // preflight downloads, generated files
  interpreter_cfg const &interpreter_info;
  isolated_package_cfg const &isolated;
  network_cfg const &network;
  command_runner &runner;
};

// Runs the package manager with `package_dir` importable, whatever the
// interpreter's path file says.
std::vector<std::string> resolver_pip_argv(resolver_env const &env,
                                           std::vector<std::string> const &args);

// Installs the package manager from `bootstrap_script` when the interpreter has
// none. Throws pipeline_error (dependency_install).
void resolver_bootstrap(resolver_env const &env,
                        std::optional<std::filesystem::path> const &bootstrap_script);

// Binary-only, no-deps download of every requirement. Throws pipeline_error
// (dependency_preflight) naming every requirement without a binary artifact;
// nothing is installed.
void resolver_preflight(resolver_env const &env, std::vector<requirement> const &bulk);

void resolver_install_bulk(resolver_env const &env, std::vector<requirement> const &bulk);

// Exactly one attempt from the selected source; no fallback to other sources.
void resolver_install_isolated(resolver_env const &env,
                               requirement const &isolated,
                               wheel_source const &source);

// Import the isolated package in a fresh interpreter. Throws pipeline_error
// (smoke_test) distinguishing "not installed" from "failed to load".
void resolver_smoke_test(resolver_env const &env);

// bootstrap -> preflight -> bulk install -> isolated install -> smoke test.
void resolver_run(resolver_env const &env,
                  dependency_closure const &closure,
                  wheel_source const &source,
                  std::optional<std::filesystem::path> const &bootstrap_script);

}  // namespace rtpack
