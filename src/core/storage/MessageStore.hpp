#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/Conversation.hpp"

namespace llmd {

// PRAGMA application_id of every structured section ("LLMD").
inline constexpr int32_t kApplicationId = 0x4C4C4D44;

struct StoreContents {
  std::vector<Message> messages;      // in sequence order
  std::vector<Attachment> attachments;
};

// One SQLite connection over an in-memory database holding the messages and
// attachments tables. Built empty for writing, or from a serialized image
// for reading. Failures throw StoreError.
class MessageStore {
public:
  // Fresh database with the current schema.
  explicit MessageStore(uint32_t schema_version);
  // Loads a serialized database image; Corrupt if SQLite cannot open it.
  explicit MessageStore(std::string_view image);
  ~MessageStore();

  MessageStore(const MessageStore&) = delete;
  MessageStore& operator=(const MessageStore&) = delete;

  void begin();
  void commit();

  void insertMessage(const Message& m, int64_t sequence);
  void insertAttachment(const Attachment& a);

  // Raw SQL against the connection.
  void exec(const std::string& sql);

  // Serialized database image.
  std::string image() const;

  // Corrupt unless PRAGMA integrity_check reports "ok".
  void checkIntegrity();
  // SchemaMismatch on wrong application id, user_version, or table shape.
  void checkSchema(uint32_t expected_version);

  std::vector<Message> loadMessages();
  std::vector<Attachment> loadAttachments();

private:
  void* db_; // sqlite3*
};

// Writes rows in the order given (sequence = index) and returns the image.
std::string writeStore(const std::vector<Message>& messages,
                       const std::vector<Attachment>& attachments,
                       uint32_t schema_version);

// Integrity, schema, rows re-sorted by sequence, then the orphan check.
StoreContents readStore(std::string_view image, uint32_t expected_schema_version);

} // namespace llmd
