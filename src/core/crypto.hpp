#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxgate::core::crypto {

// Cryptographically secure random bytes (OpenSSL RAND_bytes). Throws on failure.
std::vector<uint8_t> random_bytes(size_t count);

// Lowercase hex of `count` random bytes.
std::string random_hex(size_t count);

std::string to_hex(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> sha256(const std::string& data);

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data);

// RFC 4648 section 5 alphabet, no padding.
std::string base64url_encode(const std::vector<uint8_t>& bytes);
std::string base64url_encode(const std::string& text);
std::optional<std::string> base64url_decode(const std::string& encoded);

// Compares without early exit. Lengths are not secret.
bool constant_time_equals(const std::string& a, const std::string& b);
bool constant_time_equals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

} // namespace voxgate::core::crypto
