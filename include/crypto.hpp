#pragma once
#include <string>

namespace signrec {
namespace crypto {

// Compute HMAC-SHA256 hex string (lowercase) using key
std::string hmac_sha256_hex(const std::string& data, const std::string& key);
// Compute SHA256 hex string (lowercase)
std::string sha256_hex(const std::string& data);
// SHA256 of a file's contents, streamed. Empty string if the file can't be read.
std::string sha256_file_hex(const std::string& path);
// Constant-time comparison of two hex digests (case-insensitive)
bool digest_equal(const std::string& a, const std::string& b);

} // namespace crypto
} // namespace signrec
