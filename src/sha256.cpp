#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtpack {
namespace {

class sha256_context : unmovable {
 public:
  sha256_context() {
    mbedtls_sha256_init(&ctx_);
    if (mbedtls_sha256_starts(&ctx_, 0)) {
      mbedtls_sha256_free(&ctx_);
      throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
    }
  }

  ~sha256_context() { mbedtls_sha256_free(&ctx_); }

  void update(unsigned char const *data, std::size_t size) {
    if (size == 0) { return; }
    if (mbedtls_sha256_update(&ctx_, data, size)) {
      throw std::runtime_error("sha256: mbedtls_sha256_update failed");
    }
  }

  sha256_t finish() {
    sha256_t digest{};
    if (mbedtls_sha256_finish(&ctx_, digest.data())) {
      throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
    }
    return digest;
  }

 private:
  mbedtls_sha256_context ctx_;
};

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  sha256_context ctx;
  std::vector<unsigned char> buffer(1024 * 1024);
  for (;;) {
    auto const read_bytes{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    ctx.update(buffer.data(), read_bytes);
    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("sha256: read failed: " + file_path.string());
      }
      break;
    }
  }

  return ctx.finish();
}

sha256_t sha256(std::string_view bytes) {
  sha256_context ctx;
  ctx.update(reinterpret_cast<unsigned char const *>(bytes.data()), bytes.size());
  return ctx.finish();
}

std::string sha256_hex(std::filesystem::path const &file_path) {
  auto const digest{ sha256(file_path) };
  return util_bytes_to_hex(digest.data(), digest.size());
}

bool sha256_is_hex_digest(std::string_view value) {
  if (value.size() != 64) { return false; }
  for (char const c : value) {
    if (util_hex_char_to_int(c) < 0) { return false; }
  }
  return true;
}

void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash) {
  if (!sha256_is_hex_digest(expected_hex)) {
    throw std::runtime_error("sha256_verify: expected a 64-character hex digest, got '" +
                             expected_hex + "'");
  }

  auto const expected_bytes{ util_hex_to_bytes(expected_hex) };
  if (std::memcmp(expected_bytes.data(), actual_hash.data(), actual_hash.size()) != 0) {
    throw std::runtime_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                             util_bytes_to_hex(actual_hash.data(), actual_hash.size()));
  }
}

}  // namespace rtpack
