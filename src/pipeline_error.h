#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rtpack {

enum class error_kind {
  config,
  download,
  integrity,
  patch_invariant,
  dependency_preflight,
  dependency_install,
  smoke_test,
  prerequisite_install,
  archive_structure,
  structural_verification,
};

char const *error_kind_name(error_kind kind);

// Fatal stage failure. `subject` is the offending path, URL or requirement; `hint`
// tells the operator what to do next.
class pipeline_error : public std::runtime_error {
 public:
  pipeline_error(error_kind kind, std::string subject, std::string detail, std::string hint);

  error_kind kind() const { return kind_; }
  std::string const &subject() const { return subject_; }
  std::string const &detail() const { return detail_; }
  std::string const &hint() const { return hint_; }

 private:
  error_kind kind_;
  std::string subject_;
  std::string detail_;
  std::string hint_;
};

}  // namespace rtpack
