#include "Digest.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace llmd {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

Sha256Digest sha256(std::string_view bytes) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
      len != out.size()) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  const auto d = sha256(bytes);
  return to_hex(d.data(), d.size());
}

std::string attachment_checksum(std::string_view bytes) {
  return "sha256:" + sha256_hex(bytes);
}

} // namespace llmd
