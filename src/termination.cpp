#include "termination.h"

#include <unistd.h>

#include <csignal>
#include <tuple>

namespace {

constexpr char kInterruptedMessage[]{ "\nrtpack: interrupted, work directory left as-is\n" };

void signal_handler(int sig) {
  std::ignore = write(STDERR_FILENO, kInterruptedMessage, sizeof(kInterruptedMessage) - 1);
  _exit(128 + sig);
}

}  // namespace

namespace rtpack {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace rtpack
