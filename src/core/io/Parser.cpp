#include "Parser.hpp"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

#include "core/metadata/MetadataCodec.hpp"
#include "core/storage/MessageStore.hpp"

namespace llmd {
namespace {

std::string readExactly(std::ifstream& in, const std::string& path, uint64_t offset, uint64_t length) {
  std::string out(static_cast<size_t>(length), '\0');
  if (length == 0) return out;
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) throw IoError(path, "failed to seek to offset " + std::to_string(offset));
  in.read(&out[0], static_cast<std::streamsize>(length));
  if (in.gcount() != static_cast<std::streamsize>(length)) {
    throw IoError(path, "short read at offset " + std::to_string(offset));
  }
  return out;
}

} // namespace

Parser::Parser(ParserOptions options)
  : options_(std::move(options)) {}

Conversation Parser::parseFile(const std::filesystem::path& path) {
  state_ = ParseStep::Start;
  header_.reset();

  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    state_ = ParseStep::Failed;
    IoError err(path.string(), "cannot stat: " + ec.message());
    err.setStep(ParseStep::Start);
    throw err;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    state_ = ParseStep::Failed;
    IoError err(path.string(), "cannot open for reading");
    err.setStep(ParseStep::Start);
    throw err;
  }

  spdlog::debug("parsing {} ({} bytes)", path.string(), file_size);
  const std::string name = path.string();
  return run(file_size, [&](uint64_t offset, uint64_t length) {
    return readExactly(in, name, offset, length);
  });
}

Conversation Parser::parseBytes(std::string_view bytes) {
  state_ = ParseStep::Start;
  header_.reset();
  return run(bytes.size(), [bytes](uint64_t offset, uint64_t length) {
    // Ranges were bounds-checked against bytes.size() by decodeHeader.
    return std::string(bytes.substr(static_cast<size_t>(offset), static_cast<size_t>(length)));
  });
}

std::string Parser::readSection(const SectionReader& reader, const char* name,
                                const SectionRange& range,
                                const std::optional<Sha256Digest>& expected) const {
  std::string bytes = reader(range.offset, range.length);
  if (expected) {
    if (options_.checksums == ChecksumPolicy::Ignore) {
      spdlog::debug("{} checksum present, verification disabled", name);
    } else if (sha256(bytes) != *expected) {
      throw HeaderError(HeaderErrc::ChecksumMismatch,
                        "section bytes do not match the header's SHA-256", name);
    }
  }
  return bytes;
}

Conversation Parser::run(uint64_t file_size, const SectionReader& reader) {
  ParseStep attempting = ParseStep::HeaderRead;
  try {
    const auto head = reader(0, std::min<uint64_t>(file_size, kHeaderSize));
    header_ = decodeHeader(head, file_size);
    state_ = ParseStep::HeaderRead;

    attempting = ParseStep::MetadataRead;
    const auto text = readSection(reader, "metadata", header_->metadata, header_->metadata_checksum);
    Metadata metadata = deserializeMetadata(text);
    state_ = ParseStep::MetadataRead;

    attempting = ParseStep::StructuredRead;
    const auto image = readSection(reader, "structured", header_->structured,
                                   header_->structured_checksum);
    StoreContents contents = readStore(image, header_->schema_version);
    state_ = ParseStep::StructuredRead;

    attempting = ParseStep::Validated;
    ContainerInfo info;
    info.header = header_;
    info.file_size = file_size;
    Validator validator(ValidatorOptions{options_.timestamps, options_.accept_role});
    validator.validate(info, metadata, contents.messages, contents.attachments);
    state_ = ParseStep::Validated;

    Conversation conversation(std::move(metadata), std::move(contents.messages),
                              std::move(contents.attachments));
    state_ = ParseStep::Done;
    spdlog::debug("parsed {} messages, {} attachments",
                  conversation.messages().size(), conversation.attachments().size());
    return conversation;
  } catch (Error& e) {
    e.setStep(attempting);
    state_ = ParseStep::Failed;
    throw;
  } catch (...) {
    state_ = ParseStep::Failed;
    throw;
  }
}

} // namespace llmd
