#include "util.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

TEST_CASE("match dispatches on variant alternative") {
  using var_t = std::variant<int, std::string>;

  auto visitor{ rtpack::match{ [](int x) { return x * 2; },
                               [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, var_t{ 21 }) == 42);
  CHECK(std::visit(visitor, var_t{ std::string{ "hello" } }) == 5);
}

TEST_CASE("util_bytes_to_hex produces lowercase pairs") {
  unsigned char const bytes[]{ 0x00, 0x1f, 0xab, 0xff };
  CHECK(rtpack::util_bytes_to_hex(bytes, sizeof(bytes)) == "001fabff");
  CHECK(rtpack::util_bytes_to_hex(bytes, 0).empty());
}

TEST_CASE("util_hex_to_bytes accepts either case") {
  auto const bytes{ rtpack::util_hex_to_bytes("DEadBeef") };
  REQUIRE(bytes.size() == 4);
  CHECK(bytes[0] == 0xde);
  CHECK(bytes[3] == 0xef);
}

TEST_CASE("util_hex_to_bytes rejects malformed input") {
  CHECK_THROWS_AS(rtpack::util_hex_to_bytes("abc"), std::runtime_error);
  CHECK_THROWS_WITH_AS(rtpack::util_hex_to_bytes("zz"),
                       doctest::Contains("position 0"),
                       std::runtime_error);
}

TEST_CASE("util_format_bytes scales units") {
  CHECK(rtpack::util_format_bytes(0) == "0B");
  CHECK(rtpack::util_format_bytes(1023) == "1023B");
  CHECK(rtpack::util_format_bytes(1536) == "1.50KB");
  CHECK(rtpack::util_format_bytes(5ull * 1024 * 1024) == "5.00MB");
}

TEST_CASE("util_trim strips surrounding whitespace only") {
  CHECK(rtpack::util_trim("  a b \r\n") == "a b");
  CHECK(rtpack::util_trim(" \t ").empty());
  CHECK(rtpack::util_trim("x") == "x");
}

TEST_CASE("util_write_file creates parents and writes bytes verbatim") {
  rtpack::test::temp_dir tmp;
  auto const file{ tmp / "a" / "b" / "out.txt" };

  rtpack::util_write_file(file, std::string{ "line1\r\nline2\0tail", 17 });

  auto const bytes{ rtpack::util_load_file(file) };
  REQUIRE(bytes.size() == 17);
  CHECK(bytes[5] == '\r');
  CHECK(bytes[12] == '\0');
}

TEST_CASE("util_load_file throws on missing file") {
  CHECK_THROWS_AS(rtpack::util_load_file("/nonexistent/rtpack/file"), std::runtime_error);
}

TEST_CASE("util_read_prefix returns at most the requested bytes") {
  rtpack::test::temp_dir tmp;
  auto const file{ tmp / "data" };
  rtpack::util_write_file(file, "PK\x03\x04rest");

  auto const two{ rtpack::util_read_prefix(file, 2) };
  REQUIRE(two.size() == 2);
  CHECK(two[0] == 'P');
  CHECK(two[1] == 'K');

  rtpack::util_write_file(file, "P");
  CHECK(rtpack::util_read_prefix(file, 2).size() == 1);
}

TEST_CASE("util_make_temp_dir creates distinct directories") {
  auto const a{ rtpack::util_make_temp_dir("rtpack-util") };
  auto const b{ rtpack::util_make_temp_dir("rtpack-util") };
  rtpack::scoped_path_cleanup ca{ a };
  rtpack::scoped_path_cleanup cb{ b };

  CHECK(a != b);
  CHECK(std::filesystem::is_directory(a));
  CHECK(std::filesystem::is_directory(b));
}

TEST_CASE("scoped_path_cleanup removes trees unless released") {
  auto const removed{ rtpack::util_make_temp_dir("rtpack-util") };
  auto const kept{ rtpack::util_make_temp_dir("rtpack-util") };
  rtpack::util_write_file(removed / "nested" / "f", "x");

  {
    rtpack::scoped_path_cleanup a{ removed };
    rtpack::scoped_path_cleanup b{ kept };
    CHECK(b.release() == kept);
  }

  CHECK_FALSE(std::filesystem::exists(removed));
  CHECK(std::filesystem::exists(kept));
  std::filesystem::remove_all(kept);
}

TEST_CASE("scoped_path_cleanup reset cleans the previous target") {
  auto const first{ rtpack::util_make_temp_dir("rtpack-util") };
  auto const second{ rtpack::util_make_temp_dir("rtpack-util") };

  rtpack::scoped_path_cleanup guard{ first };
  guard.reset(second);
  CHECK_FALSE(std::filesystem::exists(first));
  CHECK(std::filesystem::exists(second));
  CHECK(guard.path() == second);
}
