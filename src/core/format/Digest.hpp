#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace llmd {

using Sha256Digest = std::array<uint8_t, 32>;

// SHA-256 via OpenSSL EVP. Throws std::runtime_error if the digest fails.
Sha256Digest sha256(std::string_view bytes);
std::string sha256_hex(std::string_view bytes);

std::string to_hex(const uint8_t* data, size_t len);

// "sha256:<hex>", the form attachment checksums are written in.
std::string attachment_checksum(std::string_view bytes);

} // namespace llmd
