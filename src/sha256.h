#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace rtpack {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256(std::string_view bytes);

std::string sha256_hex(std::filesystem::path const &file_path);

// True if `value` is 64 hex characters (either case).
bool sha256_is_hex_digest(std::string_view value);

// Verify SHA256 hash matches expected hex string (case-insensitive)
// Throws std::runtime_error with detailed message if mismatch
void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash);

}  // namespace rtpack
