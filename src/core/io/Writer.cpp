#include "Writer.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "core/format/Header.hpp"
#include "core/metadata/MetadataCodec.hpp"
#include "core/storage/AtomicFile.hpp"
#include "core/storage/MessageStore.hpp"

namespace llmd {

Writer::Writer(WriterOptions options)
  : options_(std::move(options)) {}

std::string Writer::writeBytes(const Conversation& conversation) const {
  Validator validator(ValidatorOptions{TimestampPolicy::Strict, options_.accept_role});
  validator.validate(ContainerInfo{}, conversation);

  const std::string metadata = serializeMetadata(conversation.metadata());
  const std::string structured = writeStore(conversation.messages(), conversation.attachments(),
                                            kSchemaVersion);

  Header header;
  header.metadata = {kHeaderSize, metadata.size()};
  header.structured = {kHeaderSize + metadata.size(), structured.size()};
  if (options_.section_checksums) {
    header.metadata_checksum = sha256(metadata);
    header.structured_checksum = sha256(structured);
  }
  const auto head = encodeHeader(header);

  std::string out;
  out.reserve(static_cast<size_t>(header.impliedFileSize()));
  out.append(reinterpret_cast<const char*>(head.data()), head.size());
  out.append(metadata);
  out.append(structured);
  spdlog::debug("encoded conversation: metadata {} bytes, structured {} bytes",
                metadata.size(), structured.size());
  return out;
}

void Writer::writeFile(const Conversation& conversation, const std::filesystem::path& path) const {
  const std::string bytes = writeBytes(conversation);
  writeFileAtomic(path, bytes);
  spdlog::info("wrote {} ({} messages, {} attachments)", path.string(),
               conversation.messages().size(), conversation.attachments().size());
}

} // namespace llmd
