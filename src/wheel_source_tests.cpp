#include "wheel_source.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <string>
#include <variant>

namespace {

rtpack::wheel_index_cfg index_cfg() {
  return rtpack::wheel_index_cfg{ .cpu = "https://wheels.invalid/cpu",
                                  .accelerated_base = "https://wheels.invalid/whl/",
                                  .accelerated_tags = { "cu121", "metal" } };
}

}  // namespace

TEST_CASE("wheel_source_parse maps the default token to the CPU index") {
  auto const source{ rtpack::wheel_source_parse(rtpack::kWheelSourceDefault,
                                                index_cfg(),
                                                std::nullopt) };
  auto const *cpu{ std::get_if<rtpack::wheel_source_cpu_index>(&source) };
  REQUIRE(cpu);
  CHECK(cpu->index_url == "https://wheels.invalid/cpu");
}

TEST_CASE("wheel_source_parse accepts configured accelerated tags") {
  auto const source{ rtpack::wheel_source_parse("official-accelerated-metal",
                                                index_cfg(),
                                                std::nullopt) };
  auto const *accel{ std::get_if<rtpack::wheel_source_accelerated_index>(&source) };
  REQUIRE(accel);
  CHECK(accel->tag == "metal");
  CHECK(accel->index_url == "https://wheels.invalid/whl/metal");
}

TEST_CASE("wheel_source_parse rejects unknown accelerated tags") {
  auto const err{ rtpack::test::catch_pipeline_error([] {
    rtpack::wheel_source_parse("official-accelerated-rocm", index_cfg(), std::nullopt);
  }) };
  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::config);
  CHECK(err->hint().find("cu121, metal") != std::string::npos);
}

TEST_CASE("wheel_source_parse keeps explicit URLs") {
  auto const source{ rtpack::wheel_source_parse(
      "https://mirror.invalid/llama_cpp_python-0.2.90-cp311-cp311-win_amd64.whl",
      index_cfg(),
      std::nullopt) };
  REQUIRE(std::holds_alternative<rtpack::wheel_source_url>(source));
}

TEST_CASE("wheel_source_parse resolves local wheels against the anchor") {
  rtpack::test::temp_dir tmp;
  auto const wheel{ tmp / "wheels" / "llama_cpp_python-0.2.90-cp311-cp311-win_amd64.whl" };
  rtpack::util_write_file(wheel, "PK");

  auto const source{ rtpack::wheel_source_parse(
      "wheels/llama_cpp_python-0.2.90-cp311-cp311-win_amd64.whl",
      index_cfg(),
      tmp.path()) };
  auto const *local{ std::get_if<rtpack::wheel_source_local>(&source) };
  REQUIRE(local);
  CHECK(std::filesystem::equivalent(local->path, wheel));
}

TEST_CASE("wheel_source_parse rejects missing local wheels and odd schemes") {
  rtpack::test::temp_dir tmp;

  auto const missing{ rtpack::test::catch_pipeline_error([&] {
    rtpack::wheel_source_parse("nope.whl", index_cfg(), tmp.path());
  }) };
  REQUIRE(missing);
  CHECK(missing->kind() == rtpack::error_kind::config);

  auto const scheme{ rtpack::test::catch_pipeline_error([] {
    rtpack::wheel_source_parse("ssh://host/x.whl", index_cfg(), std::nullopt);
  }) };
  REQUIRE(scheme);
  CHECK(scheme->kind() == rtpack::error_kind::config);

  CHECK(rtpack::test::catch_pipeline_error([] {
    rtpack::wheel_source_parse("  ", index_cfg(), std::nullopt);
  }));
}

TEST_CASE("wheel_source_describe names the source") {
  CHECK(rtpack::wheel_source_describe(rtpack::wheel_source_url{ "https://x.invalid/a.whl" }) ==
        "explicit URL https://x.invalid/a.whl");
  CHECK(rtpack::wheel_source_describe(
            rtpack::wheel_source_accelerated_index{ "cu121", "https://x.invalid/cu121" })
            .find("cu121") != std::string::npos);
}
