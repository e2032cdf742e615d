#pragma once

#include "command_runner.h"
#include "fetch.h"
#include "manifest.h"
#include "packager.h"
#include "pipeline_error.h"
#include "prerequisite.h"
#include "wheel_source.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rtpack {

struct pipeline_options {
  std::filesystem::path app_repo;
  std::string wheel_source_token{ kWheelSourceDefault };
  std::optional<std::string> version_override;
  std::filesystem::path work_dir;
  std::filesystem::path output_dir;
};

// External effects the stages go through. `prerequisite` may be null when the
// manifest configures no prerequisite.
struct pipeline_services {
  command_runner &runner;
  fetcher &fetch;
  prerequisite_host *prerequisite;
};

struct stage_output {
  std::string stage;
  std::filesystem::path path;  // primary product of the stage
};

using stage_result = std::variant<stage_output, pipeline_error>;

// Shared, read-mostly state threaded through the stages of one build.
struct pipeline_context {
  manifest const &cfg;
  std::filesystem::path app_repo;
  wheel_source wheels;
  std::string version;
  std::filesystem::path work_dir;
  std::filesystem::path output_dir;
  pipeline_services services;

  // Filled in by the fetch stage.
  std::optional<std::filesystem::path> bootstrap_script;
  std::optional<std::filesystem::path> prerequisite_installer;

  // Filled in by the package stage.
  std::optional<package_result> package;

  std::filesystem::path runtime_dir() const { return work_dir / "runtime"; }
  std::filesystem::path downloads_dir() const { return work_dir / "downloads"; }
  std::filesystem::path stage_dir() const { return work_dir / "stage"; }
  std::filesystem::path scratch_dir() const { return work_dir / "scratch"; }
  std::filesystem::path interpreter_dir() const;
  std::filesystem::path interpreter_binary() const;
  std::filesystem::path package_dir() const;
};

// Validate the application repository, resolve the wheel source and version, and
// start from an empty work directory. Throws pipeline_error (config).
pipeline_context pipeline_prepare(manifest const &cfg,
                                  pipeline_options const &options,
                                  pipeline_services services);

// Run one stage body. pipeline_error passes through; any other exception is
// reported under `fallback`.
stage_result pipeline_run_stage(std::string const &name,
                                error_kind fallback,
                                std::function<std::filesystem::path()> const &body);

std::filesystem::path pipeline_stage_fetch(pipeline_context &ctx);
std::filesystem::path pipeline_stage_resolve(pipeline_context &ctx);
std::filesystem::path pipeline_stage_patch(pipeline_context &ctx);
std::filesystem::path pipeline_stage_prerequisite(pipeline_context &ctx);
std::filesystem::path pipeline_stage_package(pipeline_context &ctx);

struct build_outcome {
  std::vector<stage_output> completed;
  std::optional<pipeline_error> error;  // first failure; later stages did not run
};

// fetch -> resolve -> patch -> prerequisite -> package, stopping at the first
// failure.
build_outcome pipeline_build(pipeline_context &ctx);

}  // namespace rtpack
