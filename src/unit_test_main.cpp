#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

#include "libgit2_util.h"
#include "tui.h"

#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  rtpack::tui::init();
  rtpack::tui::set_output_handler([](std::string_view) {});

  rtpack::libgit2_scope git_guard;
  return context.run();
}
