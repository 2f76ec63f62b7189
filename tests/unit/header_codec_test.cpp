#include "core/Errors.hpp"
#include "core/format/Header.hpp"
#include "../test_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using llmd::decodeHeader;
using llmd::encodeHeader;
using llmd::Header;
using llmd::HeaderErrc;
using llmd::HeaderError;
using llmd::kHeaderSize;
using llmd::tests::ExpectThrow;
using llmd::tests::Require;

// Header followed by zero filler up to the implied file size.
std::string BuildFile(const Header& header) {
  const auto head = encodeHeader(header);
  std::string out(reinterpret_cast<const char*>(head.data()), head.size());
  out.resize(static_cast<size_t>(header.impliedFileSize()), '\0');
  return out;
}

Header SampleHeader() {
  Header h;
  h.metadata = {kHeaderSize, 40};
  h.structured = {kHeaderSize + 40, 60};
  return h;
}

void ExpectHeaderError(const std::string& name, const std::string& bytes, uint64_t file_size,
                       HeaderErrc code, const std::string& context = "header") {
  ExpectThrow<HeaderError>(
      name, [&]() { (void)decodeHeader(bytes, file_size); },
      [&](const HeaderError& e) { return e.code() == code && e.context() == context; });
}

void ScenarioRoundTrip() {
  llmd::tests::Log("scenario: encoded header decodes to the same fields");
  Header h = SampleHeader();
  h.schema_version = 1;
  h.metadata_checksum = llmd::sha256("metadata");
  const auto file = BuildFile(h);
  Require(file.size() == kHeaderSize + 100, "unexpected file size");

  const auto decoded = decodeHeader(file, file.size());
  Require(decoded.version == llmd::kFormatVersion, "version mismatch");
  Require(decoded.schema_version == 1, "schema version mismatch");
  Require(decoded.metadata.offset == kHeaderSize && decoded.metadata.length == 40, "metadata range mismatch");
  Require(decoded.structured.offset == kHeaderSize + 40 && decoded.structured.length == 60,
          "structured range mismatch");
  Require(decoded.metadata_checksum == h.metadata_checksum, "metadata checksum mismatch");
  Require(!decoded.structured_checksum.has_value(), "structured checksum should be absent");
}

void ScenarioLayout() {
  llmd::tests::Log("scenario: magic, version and header size sit at fixed offsets");
  const auto head = encodeHeader(SampleHeader());
  Require(head[0] == 'L' && head[1] == 'L' && head[2] == 'M' && head[3] == 'D', "magic not at offset 0");
  Require(head[4] == llmd::kFormatVersion, "version not at offset 4");
  Require(head[6] == 128 && head[7] == 0, "header size not little-endian at offset 6");
  Require(head[16] == 128 && head[24] == 40, "metadata offset/length not at 16/24");
}

void ScenarioBadMagic() {
  llmd::tests::Log("scenario: wrong leading bytes fail with BadMagic");
  auto file = BuildFile(SampleHeader());
  file[0] = 'X';
  ExpectHeaderError("bad_magic", file, file.size(), HeaderErrc::BadMagic);

  // Short files with the wrong prefix are still reported as BadMagic.
  ExpectHeaderError("bad_magic_short", "PK\x03\x04", 4, HeaderErrc::BadMagic);
}

void ScenarioTruncated() {
  llmd::tests::Log("scenario: files shorter than the header fail with Truncated");
  const auto file = BuildFile(SampleHeader());
  const auto cut = file.substr(0, 64);
  ExpectHeaderError("truncated_64", cut, cut.size(), HeaderErrc::Truncated);
  ExpectHeaderError("truncated_magic_only", "LLM", 3, HeaderErrc::Truncated);
  ExpectHeaderError("truncated_empty", "", 0, HeaderErrc::Truncated);
}

void ScenarioUnsupportedVersion() {
  llmd::tests::Log("scenario: unknown container version is rejected");
  auto file = BuildFile(SampleHeader());
  file[4] = 9;
  ExpectHeaderError("version_9", file, file.size(), HeaderErrc::UnsupportedVersion);
}

void ScenarioMalformed() {
  llmd::tests::Log("scenario: unknown flags, header size and reserved bytes are Malformed");
  auto flags = BuildFile(SampleHeader());
  flags[5] = static_cast<char>(0x80);
  ExpectHeaderError("unknown_flag", flags, flags.size(), HeaderErrc::Malformed);

  auto size = BuildFile(SampleHeader());
  size[6] = 64;
  ExpectHeaderError("header_size", size, size.size(), HeaderErrc::Malformed);

  auto reserved = BuildFile(SampleHeader());
  reserved[120] = 1;
  ExpectHeaderError("reserved", reserved, reserved.size(), HeaderErrc::Malformed);
}

void ScenarioBadOffsets() {
  llmd::tests::Log("scenario: out-of-bounds or overlapping sections fail with BadOffsets");
  const auto file = BuildFile(SampleHeader());

  // Structured section runs one byte past the end of the file.
  ExpectHeaderError("structured_past_eof", file, file.size() - 1, HeaderErrc::BadOffsets, "structured");

  Header huge = SampleHeader();
  huge.structured.length = UINT64_MAX - 10;
  const auto head = encodeHeader(huge);
  std::string wrapped(reinterpret_cast<const char*>(head.data()), head.size());
  wrapped.resize(kHeaderSize + 100, '\0');
  ExpectHeaderError("structured_wraps", wrapped, wrapped.size(), HeaderErrc::BadOffsets, "structured");

  Header inside = SampleHeader();
  inside.metadata.offset = 64;
  const auto inside_head = encodeHeader(inside);
  std::string inside_file(reinterpret_cast<const char*>(inside_head.data()), inside_head.size());
  inside_file.resize(kHeaderSize + 100, '\0');
  ExpectHeaderError("metadata_inside_header", inside_file, inside_file.size(), HeaderErrc::BadOffsets,
                    "metadata");

  Header overlap = SampleHeader();
  overlap.structured.offset = kHeaderSize + 20;
  const auto overlap_file = BuildFile(overlap);
  ExpectHeaderError("overlap", overlap_file, overlap_file.size(), HeaderErrc::BadOffsets);
}

}  // namespace

int main() {
  try {
    llmd::tests::Log("header_codec_test: start");
    ScenarioRoundTrip();
    ScenarioLayout();
    ScenarioBadMagic();
    ScenarioTruncated();
    ScenarioUnsupportedVersion();
    ScenarioMalformed();
    ScenarioBadOffsets();
    llmd::tests::Log("header_codec_test: finished");
    std::cout << "header_codec_test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    llmd::tests::LogError(ex.what());
    std::cerr << "header_codec_test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
