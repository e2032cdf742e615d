#pragma once

#include "command_runner.h"
#include "manifest.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rtpack {

enum class check_status { passed, failed, skipped };

struct check_result {
  std::string name;
  check_status status;
  std::string detail;
};

class verification_report {
 public:
  void add(std::string name, check_status status, std::string detail = {});

  std::vector<check_result> const &checks() const { return checks_; }
  check_result const *first_failure() const;
  std::size_t failure_count() const;
  bool passed() const { return failure_count() == 0; }

  // One line per check, then a summary naming the first failure.
  std::string render() const;

 private:
  std::vector<check_result> checks_;
};

enum class verify_outcome { passed, checks_failed, archive_not_found, extraction_failed };

char const *verify_outcome_name(verify_outcome outcome);

struct verify_options {
  layout_cfg layout;
  interpreter_cfg interpreter;
  dependencies_cfg dependencies;
  std::chrono::seconds timeout{ 120 };  // per interpreter/VCS invocation
  bool keep{ false };                   // keep the extraction directory on success
};

verify_options verify_options_from(manifest const &m);

struct verify_result {
  verify_outcome outcome;
  verification_report report;
  std::optional<std::filesystem::path> extracted_dir;  // set when left on disk
  std::string error;                                   // archive_not_found / extraction_failed
};

// Extract `archive` into a new temporary directory and run every check, in order,
// without stopping at failures.
verify_result verifier_run(std::filesystem::path const &archive,
                           verify_options const &options,
                           command_runner &runner);

}  // namespace rtpack
