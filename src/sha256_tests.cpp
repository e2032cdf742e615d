#include "sha256.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

namespace {

constexpr char kAbcHex[]{ "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" };
constexpr char kEmptyHex[]{
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
};

std::string hex(rtpack::sha256_t const &digest) {
  return rtpack::util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace

TEST_CASE("sha256 of bytes matches known vectors") {
  CHECK(hex(rtpack::sha256(std::string_view{ "abc" })) == kAbcHex);
  CHECK(hex(rtpack::sha256(std::string_view{})) == kEmptyHex);
}

TEST_CASE("sha256 of a file matches the in-memory digest") {
  rtpack::test::temp_dir tmp;
  auto const file{ tmp / "abc.txt" };
  rtpack::util_write_file(file, "abc");

  CHECK(rtpack::sha256_hex(file) == kAbcHex);
  CHECK(rtpack::sha256(file) == rtpack::sha256(std::string_view{ "abc" }));
}

TEST_CASE("sha256 of a file larger than one read buffer") {
  rtpack::test::temp_dir tmp;
  auto const file{ tmp / "big.bin" };
  std::string const content(1024 * 1024 + 7, 'z');
  rtpack::util_write_file(file, content);

  CHECK(rtpack::sha256(file) == rtpack::sha256(std::string_view{ content }));
}

TEST_CASE("sha256 throws for missing file") {
  CHECK_THROWS_AS(rtpack::sha256(std::filesystem::path{ "/nonexistent/rtpack.bin" }),
                  std::runtime_error);
}

TEST_CASE("sha256_is_hex_digest requires 64 hex characters") {
  CHECK(rtpack::sha256_is_hex_digest(kAbcHex));
  CHECK(rtpack::sha256_is_hex_digest("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
  CHECK_FALSE(rtpack::sha256_is_hex_digest("ba7816bf"));
  CHECK_FALSE(rtpack::sha256_is_hex_digest(
      "ga7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
  CHECK_FALSE(rtpack::sha256_is_hex_digest(""));
}

TEST_CASE("sha256_verify accepts any case and rejects mismatches") {
  auto const digest{ rtpack::sha256(std::string_view{ "abc" }) };
  CHECK_NOTHROW(rtpack::sha256_verify(kAbcHex, digest));
  CHECK_NOTHROW(rtpack::sha256_verify(
      "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD", digest));
  CHECK_THROWS_AS(rtpack::sha256_verify(kEmptyHex, digest), std::runtime_error);
  CHECK_THROWS_AS(rtpack::sha256_verify("abcd", digest), std::runtime_error);
}
