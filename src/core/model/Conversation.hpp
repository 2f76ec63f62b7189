#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "Timestamp.hpp"

namespace llmd {

using ordered_json = nlohmann::ordered_json;

// Metadata version stamped on freshly authored conversations.
inline constexpr const char* kMetadataVersion = "0.1";

// user, assistant, system, function, tool
bool isKnownRole(std::string_view role);

struct Metadata {
  std::string version = kMetadataVersion;
  Timestamp   created_at;
  std::vector<std::string> participants;

  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<std::vector<std::string>> tags;
  std::optional<std::string> language;
  std::optional<ordered_json> model_info;

  // Unrecognised keys, re-emitted verbatim and in order on write.
  ordered_json extensions = ordered_json::object();
};

struct Message {
  std::string id;
  std::string role;
  std::string content;
  Timestamp   timestamp;
  std::optional<std::string>  parent_id;
  std::optional<ordered_json> metadata;
};

struct InlineData {
  std::string bytes;
};

struct ExternalReference {
  std::string uri;
};

struct Attachment {
  std::string id;
  std::string message_id;  // owning message
  std::string media_type;
  std::optional<std::string> filename;
  std::variant<InlineData, ExternalReference> payload;
  std::optional<uint64_t>    size;
  std::optional<std::string> checksum;  // "sha256:<hex>" or opaque
  std::optional<Timestamp>   created_at;

  bool isInline() const { return std::holds_alternative<InlineData>(payload); }
};

bool operator==(const Metadata& a, const Metadata& b);
bool operator==(const Message& a, const Message& b);
bool operator==(const Attachment& a, const Attachment& b);
inline bool operator!=(const Metadata& a, const Metadata& b) { return !(a == b); }
inline bool operator!=(const Message& a, const Message& b) { return !(a == b); }
inline bool operator!=(const Attachment& a, const Attachment& b) { return !(a == b); }

// Metadata plus the ordered message sequence and the attachments owned by
// those messages. Mutators do not validate; the Writer validates before
// anything reaches disk. Not safe for concurrent mutation.
class Conversation {
public:
  Conversation() = default;
  explicit Conversation(Metadata metadata);
  Conversation(Metadata metadata, std::vector<Message> messages, std::vector<Attachment> attachments);

  // Version kMetadataVersion, created now.
  static Conversation create(std::vector<std::string> participants,
                             std::optional<std::string> title = std::nullopt);

  // Random UUIDv4 text.
  static std::string newId();

  const Metadata& metadata() const { return metadata_; }
  Metadata& metadata() { return metadata_; }
  const std::vector<Message>& messages() const { return messages_; }
  const std::vector<Attachment>& attachments() const { return attachments_; }

  const Message* findMessage(const std::string& id) const;
  std::vector<const Attachment*> attachmentsFor(const std::string& message_id) const;

  // Appends at the end of the turn order; an empty id is replaced by newId().
  Message& appendMessage(Message message);
  Message& appendMessage(std::string role, std::string content);

  // Replaces the message with the same id in place. False if absent.
  bool updateMessage(const Message& message);

  // Drops the message and every attachment it owns. False if absent.
  bool removeMessage(const std::string& id);

  // Sets message_id, fills id, and for inline payloads fills size and checksum
  // when they are not given.
  Attachment& addAttachment(const std::string& message_id, Attachment attachment);

private:
  Metadata metadata_;
  std::vector<Message> messages_;
  std::vector<Attachment> attachments_;
};

bool operator==(const Conversation& a, const Conversation& b);
inline bool operator!=(const Conversation& a, const Conversation& b) { return !(a == b); }

} // namespace llmd
