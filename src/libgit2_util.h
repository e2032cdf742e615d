#pragma once

#include "util.h"

namespace rtpack {

// RAII wrapper for libgit2 global initialization/shutdown. Nests.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

}  // namespace rtpack
