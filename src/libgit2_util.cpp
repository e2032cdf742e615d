#include "libgit2_util.h"

#include <git2.h>

#include <stdexcept>
#include <string>

namespace rtpack {

libgit2_scope::libgit2_scope() {
  if (int const rc{ git_libgit2_init() }; rc < 0) {
    throw std::runtime_error("git_libgit2_init failed: " + std::to_string(rc));
  }
}

libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

}  // namespace rtpack
