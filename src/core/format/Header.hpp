#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "Digest.hpp"

namespace llmd {

// "LLMD" in ASCII
inline constexpr std::array<uint8_t, 4> kMagic = {0x4C, 0x4C, 0x4D, 0x44};

inline constexpr uint8_t  kFormatVersion = 1;
inline constexpr uint32_t kSchemaVersion = 1;
inline constexpr size_t   kHeaderSize = 128;

inline constexpr uint8_t kFlagMetadataChecksum   = 0x01;
inline constexpr uint8_t kFlagStructuredChecksum = 0x02;

struct SectionRange {
  uint64_t offset = 0;
  uint64_t length = 0;
};

// Fixed 128-byte little-endian record at the start of every file:
//   0  magic[4]          4  version u8       5  flags u8
//   6  header_size u16   8  schema_version u32   12 reserved u32
//   16 metadata offset/length (u64, u64)
//   32 structured offset/length (u64, u64)
//   48 metadata sha256[32]   80 structured sha256[32]   112 reserved[16]
struct Header {
  uint8_t  version = kFormatVersion;
  uint32_t schema_version = kSchemaVersion;
  SectionRange metadata;
  SectionRange structured;
  std::optional<Sha256Digest> metadata_checksum;
  std::optional<Sha256Digest> structured_checksum;

  // End of the furthest section; a well-formed file is exactly this long.
  uint64_t impliedFileSize() const;
};

bool isSupportedVersion(uint8_t version);

std::array<uint8_t, kHeaderSize> encodeHeader(const Header& header);

// `bytes` holds at least the leading header bytes of a file that is
// `file_size` bytes long. Throws HeaderError.
Header decodeHeader(std::string_view bytes, uint64_t file_size);

} // namespace llmd
