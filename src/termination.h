#pragma once

namespace rtpack {

// Install SIGINT/SIGTERM handler. Handler calls _exit(128 + signal) immediately;
// partial work-directory state is discarded by the next build.
void termination_handler_install();

}  // namespace rtpack
