#include "tui.h"

#include "doctest.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(rtpack::tui::init(), std::logic_error);
}

TEST_CASE("tui allows handler changes while idle") {
  CHECK_NOTHROW(rtpack::tui::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(rtpack::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(rtpack::tui::set_output_handler(handler));
  CHECK_NOTHROW(rtpack::tui::run(rtpack::tui::level::TUI_INFO));
  CHECK_NOTHROW(rtpack::tui::shutdown());

  CHECK_NOTHROW(rtpack::tui::run(std::nullopt));
  CHECK_THROWS_AS(rtpack::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(rtpack::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(rtpack::tui::shutdown());
  CHECK_THROWS_AS(rtpack::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(rtpack::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    rtpack::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      rtpack::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(rtpack::tui::run(std::nullopt));

  rtpack::tui::debug("hello %s", "world");
  rtpack::tui::info("value %d", 42);
  rtpack::tui::warn("three %d", 3);
  rtpack::tui::error("boom");

  CHECK_NOTHROW(rtpack::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(rtpack::tui::run(rtpack::tui::level::TUI_DEBUG, true));
  rtpack::tui::info("structured %d", 7);
  CHECK_NOTHROW(rtpack::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") ==
        line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(rtpack::tui::run(rtpack::tui::level::TUI_WARN, true));
  rtpack::tui::debug("debug");
  rtpack::tui::info("info");
  rtpack::tui::warn("warn");
  rtpack::tui::error("error");
  CHECK_NOTHROW(rtpack::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);

  messages.clear();
  CHECK_NOTHROW(rtpack::tui::run(rtpack::tui::level::TUI_INFO, true));
  rtpack::tui::debug("debug");
  rtpack::tui::info("info");
  CHECK_NOTHROW(rtpack::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("INF") != std::string::npos);
  CHECK(messages[0].find("info") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui long messages are not truncated") {
  std::string const long_text(3000, 'x');
  CHECK_NOTHROW(rtpack::tui::run(std::nullopt));
  rtpack::tui::error("%s", long_text.c_str());
  CHECK_NOTHROW(rtpack::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == long_text + "\n");
}

TEST_CASE_FIXTURE(captured_output, "tui scope runs and shuts down") {
  {
    rtpack::tui::scope const s{ rtpack::tui::level::TUI_INFO, false };
    rtpack::tui::info("inside scope");
  }

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "inside scope\n");
  CHECK_THROWS_AS(rtpack::tui::shutdown(), std::logic_error);
}
