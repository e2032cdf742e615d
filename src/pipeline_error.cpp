#include "pipeline_error.h"

#include <utility>

namespace rtpack {
namespace {

std::string format_message(error_kind kind,
                           std::string const &subject,
                           std::string const &detail,
                           std::string const &hint) {
  std::string msg{ error_kind_name(kind) };
  msg += ": ";
  msg += detail;
  if (!subject.empty()) { msg += " [" + subject + "]"; }
  if (!hint.empty()) { msg += "\n  hint: " + hint; }
  return msg;
}

}  // namespace

char const *error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::config: return "ConfigError";
    case error_kind::download: return "DownloadError";
    case error_kind::integrity: return "IntegrityError";
    case error_kind::patch_invariant: return "PatchInvariantError";
    case error_kind::dependency_preflight: return "DependencyPreflightError";
    case error_kind::dependency_install: return "DependencyInstallError";
    case error_kind::smoke_test: return "SmokeTestError";
    case error_kind::prerequisite_install: return "PrerequisiteInstallError";
    case error_kind::archive_structure: return "ArchiveStructureError";
    case error_kind::structural_verification: return "StructuralVerificationError";
  }
  return "UnknownError";
}

pipeline_error::pipeline_error(error_kind kind,
                               std::string subject,
                               std::string detail,
                               std::string hint)
    : std::runtime_error{ format_message(kind, subject, detail, hint) },
      kind_{ kind },
      subject_{ std::move(subject) },
      detail_{ std::move(detail) },
      hint_{ std::move(hint) } {}

}  // namespace rtpack
