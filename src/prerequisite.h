#pragma once

#include "command_runner.h"
#include "manifest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace rtpack {

enum class installer_exit_class { success, restart_pending, failure };

enum class prerequisite_outcome {
  already_present,
  installed,
  installed_restart_pending,
};

installer_exit_class prerequisite_classify_exit(int exit_code, prerequisite_cfg const &cfg);

char const *prerequisite_outcome_name(prerequisite_outcome outcome);

// Host-level view of the prerequisite: the installation marker and the silent
// installer.
class prerequisite_host : unmovable {
 public:
  virtual ~prerequisite_host() = default;
  virtual bool marker_present() = 0;
  virtual int run_installer(std::filesystem::path const &installer,
                            std::vector<std::string> const &args) = 0;

 protected:
  prerequisite_host() = default;
};

// Marker is a file path; the installer is run through a command_runner.
class filesystem_prerequisite_host : public prerequisite_host {
 public:
  filesystem_prerequisite_host(std::filesystem::path marker, command_runner &runner);

  bool marker_present() override;
  int run_installer(std::filesystem::path const &installer,
                    std::vector<std::string> const &args) override;

 private:
  std::filesystem::path marker_;
  command_runner &runner_;
};

// Check-first; installs only when the marker is absent and confirms the marker
// afterwards. Throws pipeline_error (prerequisite_install) on failure.
prerequisite_outcome prerequisite_ensure(prerequisite_cfg const &cfg,
                                         std::filesystem::path const &installer,
                                         prerequisite_host &host);

}  // namespace rtpack
