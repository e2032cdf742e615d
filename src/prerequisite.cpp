#include "prerequisite.h"

#include "pipeline_error.h"
#include "tui.h"

#include <algorithm>

namespace rtpack {

installer_exit_class prerequisite_classify_exit(int exit_code, prerequisite_cfg const &cfg) {
  if (std::ranges::find(cfg.success_codes, exit_code) != cfg.success_codes.end()) {
    return installer_exit_class::success;
  }
  if (std::ranges::find(cfg.restart_codes, exit_code) != cfg.restart_codes.end()) {
    return installer_exit_class::restart_pending;
  }
  return installer_exit_class::failure;
}

char const *prerequisite_outcome_name(prerequisite_outcome outcome) {
  switch (outcome) {
    case prerequisite_outcome::already_present: return "already present";
    case prerequisite_outcome::installed: return "installed";
    case prerequisite_outcome::installed_restart_pending: return "installed, restart pending";
  }
  return "unknown";
}

filesystem_prerequisite_host::filesystem_prerequisite_host(std::filesystem::path marker,
                                                           command_runner &runner)
    : marker_{ std::move(marker) }, runner_{ runner } {}

bool filesystem_prerequisite_host::marker_present() {
  std::error_code ec;
  return std::filesystem::exists(marker_, ec);
}

int filesystem_prerequisite_host::run_installer(std::filesystem::path const &installer,
                                                std::vector<std::string> const &args) {
  std::vector<std::string> argv{ installer.string() };
  argv.insert(argv.end(), args.begin(), args.end());
  auto const out{ runner_.run(argv, command_options{}) };
  for (auto const &line : out.lines) { tui::debug("installer: %s", line.c_str()); }
  return out.exit_code;
}

prerequisite_outcome prerequisite_ensure(prerequisite_cfg const &cfg,
                                         std::filesystem::path const &installer,
                                         prerequisite_host &host) {
  if (host.marker_present()) {
    tui::info("%s: already installed", cfg.name.c_str());
    return prerequisite_outcome::already_present;
  }

  tui::info("%s: not found, running silent installer", cfg.name.c_str());
  int const exit_code{ host.run_installer(installer, cfg.args) };
  auto const exit_class{ prerequisite_classify_exit(exit_code, cfg) };
  bool const confirmed{ host.marker_present() };

  if (confirmed) {
    if (exit_class == installer_exit_class::restart_pending) {
      tui::warn("%s: installed (exit %d), a restart is pending before bundled binaries run "
                "on this host",
                cfg.name.c_str(),
                exit_code);
      return prerequisite_outcome::installed_restart_pending;
    }
    if (exit_class == installer_exit_class::failure) {
      tui::warn("%s: installer exited with %d but the installation marker is present",
                cfg.name.c_str(),
                exit_code);
    }
    return prerequisite_outcome::installed;
  }

  switch (exit_class) {
    case installer_exit_class::restart_pending:
      tui::warn("%s: installer requested a restart (exit %d); marker not yet visible",
                cfg.name.c_str(),
                exit_code);
      return prerequisite_outcome::installed_restart_pending;

    case installer_exit_class::success:
      throw pipeline_error(error_kind::prerequisite_install,
                           installer.string(),
                           cfg.name + " installer reported success (exit " +
                               std::to_string(exit_code) +
                               ") but the installation marker is missing: " +
                               cfg.marker.string(),
                           "install " + cfg.name + " manually from " + installer.string() +
                               ", then rerun the build");

    case installer_exit_class::failure: break;
  }

  throw pipeline_error(error_kind::prerequisite_install,
                       installer.string(),
                       cfg.name + " installer failed with exit code " +
                           std::to_string(exit_code),
                       "run the installer interactively to see the error, or reboot and retry");
}

}  // namespace rtpack
