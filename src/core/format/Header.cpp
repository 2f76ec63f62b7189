#include "Header.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>

#include "core/Errors.hpp"

namespace llmd {
namespace {

constexpr size_t kOffVersion          = 4;
constexpr size_t kOffFlags            = 5;
constexpr size_t kOffHeaderSize       = 6;
constexpr size_t kOffSchemaVersion    = 8;
constexpr size_t kOffReserved0        = 12;
constexpr size_t kOffMetadataOffset   = 16;
constexpr size_t kOffMetadataLength   = 24;
constexpr size_t kOffStructuredOffset = 32;
constexpr size_t kOffStructuredLength = 40;
constexpr size_t kOffMetadataSha      = 48;
constexpr size_t kOffStructuredSha    = 80;
constexpr size_t kOffReserved1        = 112;

constexpr uint8_t kKnownFlags = kFlagMetadataChecksum | kFlagStructuredChecksum;

template <typename T>
T readLE(std::string_view bytes, size_t offset) {
  static_assert(std::is_unsigned_v<T>, "readLE requires unsigned type");
  T out = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    out |= static_cast<T>(static_cast<uint8_t>(bytes[offset + i])) << (8U * i);
  }
  return out;
}

template <typename T>
void writeLE(std::array<uint8_t, kHeaderSize>& bytes, size_t offset, T value) {
  static_assert(std::is_unsigned_v<T>, "writeLE requires unsigned type");
  for (size_t i = 0; i < sizeof(T); ++i) {
    bytes[offset + i] = static_cast<uint8_t>((value >> (8U * i)) & 0xFFU);
  }
}

Sha256Digest readDigest(std::string_view bytes, size_t offset) {
  Sha256Digest out{};
  for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<uint8_t>(bytes[offset + i]);
  return out;
}

bool allZero(std::string_view bytes, size_t offset, size_t len) {
  return std::all_of(bytes.begin() + offset, bytes.begin() + offset + len,
                     [](char c) { return c == 0; });
}

// offset+length must not wrap and must stay inside [kHeaderSize, file_size].
void checkSection(const char* name, const SectionRange& s, uint64_t file_size) {
  if (s.offset < kHeaderSize) {
    throw HeaderError(HeaderErrc::BadOffsets,
                      "section starts inside the header at offset " + std::to_string(s.offset),
                      name);
  }
  if (s.length > std::numeric_limits<uint64_t>::max() - s.offset ||
      s.offset + s.length > file_size) {
    throw HeaderError(HeaderErrc::BadOffsets,
                      "section [" + std::to_string(s.offset) + ", +" + std::to_string(s.length) +
                      ") exceeds file length " + std::to_string(file_size),
                      name);
  }
}

} // namespace

uint64_t Header::impliedFileSize() const {
  return std::max<uint64_t>({kHeaderSize,
                             metadata.offset + metadata.length,
                             structured.offset + structured.length});
}

bool isSupportedVersion(uint8_t version) {
  return version == kFormatVersion;
}

std::array<uint8_t, kHeaderSize> encodeHeader(const Header& header) {
  std::array<uint8_t, kHeaderSize> out{};
  std::copy(kMagic.begin(), kMagic.end(), out.begin());

  uint8_t flags = 0;
  if (header.metadata_checksum)   flags |= kFlagMetadataChecksum;
  if (header.structured_checksum) flags |= kFlagStructuredChecksum;

  out[kOffVersion] = header.version;
  out[kOffFlags] = flags;
  writeLE<uint16_t>(out, kOffHeaderSize, static_cast<uint16_t>(kHeaderSize));
  writeLE<uint32_t>(out, kOffSchemaVersion, header.schema_version);
  writeLE<uint64_t>(out, kOffMetadataOffset, header.metadata.offset);
  writeLE<uint64_t>(out, kOffMetadataLength, header.metadata.length);
  writeLE<uint64_t>(out, kOffStructuredOffset, header.structured.offset);
  writeLE<uint64_t>(out, kOffStructuredLength, header.structured.length);
  if (header.metadata_checksum) {
    std::copy(header.metadata_checksum->begin(), header.metadata_checksum->end(),
              out.begin() + kOffMetadataSha);
  }
  if (header.structured_checksum) {
    std::copy(header.structured_checksum->begin(), header.structured_checksum->end(),
              out.begin() + kOffStructuredSha);
  }
  return out;
}

Header decodeHeader(std::string_view bytes, uint64_t file_size) {
  const size_t available = std::min<uint64_t>(bytes.size(), file_size);
  const size_t magic_len = std::min(available, kMagic.size());
  for (size_t i = 0; i < magic_len; ++i) {
    if (static_cast<uint8_t>(bytes[i]) != kMagic[i]) {
      throw HeaderError(HeaderErrc::BadMagic, "leading bytes are not \"LLMD\"");
    }
  }
  if (available < kHeaderSize) {
    throw HeaderError(HeaderErrc::Truncated,
                      "need " + std::to_string(kHeaderSize) + " header bytes, have " +
                      std::to_string(available));
  }

  Header h;
  h.version = static_cast<uint8_t>(bytes[kOffVersion]);
  if (!isSupportedVersion(h.version)) {
    throw HeaderError(HeaderErrc::UnsupportedVersion,
                      "container version " + std::to_string(h.version) + " is not supported");
  }

  const auto flags = static_cast<uint8_t>(bytes[kOffFlags]);
  if ((flags & ~kKnownFlags) != 0) {
    throw HeaderError(HeaderErrc::Malformed, "unknown flag bits set: " + std::to_string(flags));
  }
  const auto header_size = readLE<uint16_t>(bytes, kOffHeaderSize);
  if (header_size != kHeaderSize) {
    throw HeaderError(HeaderErrc::Malformed,
                      "header size field is " + std::to_string(header_size));
  }
  if (!allZero(bytes, kOffReserved0, 4) || !allZero(bytes, kOffReserved1, kHeaderSize - kOffReserved1)) {
    throw HeaderError(HeaderErrc::Malformed, "reserved bytes are not zero");
  }

  h.schema_version = readLE<uint32_t>(bytes, kOffSchemaVersion);
  h.metadata.offset = readLE<uint64_t>(bytes, kOffMetadataOffset);
  h.metadata.length = readLE<uint64_t>(bytes, kOffMetadataLength);
  h.structured.offset = readLE<uint64_t>(bytes, kOffStructuredOffset);
  h.structured.length = readLE<uint64_t>(bytes, kOffStructuredLength);
  if (flags & kFlagMetadataChecksum)   h.metadata_checksum = readDigest(bytes, kOffMetadataSha);
  if (flags & kFlagStructuredChecksum) h.structured_checksum = readDigest(bytes, kOffStructuredSha);

  checkSection("metadata", h.metadata, file_size);
  checkSection("structured", h.structured, file_size);

  const SectionRange& first  = h.metadata.offset <= h.structured.offset ? h.metadata : h.structured;
  const SectionRange& second = &first == &h.metadata ? h.structured : h.metadata;
  if (first.offset + first.length > second.offset) {
    throw HeaderError(HeaderErrc::BadOffsets, "metadata and structured sections overlap");
  }
  return h;
}

} // namespace llmd
