#include "MessageStore.hpp"

#include <cstring>
#include <optional>
#include <set>
#include <utility>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace llmd {
namespace {

const char* kSchemaSql = R"SQL(
  CREATE TABLE messages (
    id        TEXT PRIMARY KEY,
    sequence  INTEGER NOT NULL UNIQUE,
    role      TEXT NOT NULL,
    content   TEXT NOT NULL,
    timestamp TEXT NOT NULL,
    parent_id TEXT,
    metadata  TEXT
  );
  CREATE TABLE attachments (
    id         TEXT PRIMARY KEY,
    message_id TEXT NOT NULL REFERENCES messages(id),
    media_type TEXT NOT NULL,
    filename   TEXT,
    payload    BLOB,
    reference  TEXT,
    size       INTEGER,
    checksum   TEXT,
    created_at TEXT
  );
  CREATE INDEX idx_attachments_message_id ON attachments(message_id);
)SQL";

const std::vector<std::string> kMessageColumns = {
  "id", "sequence", "role", "content", "timestamp", "parent_id", "metadata"
};
const std::vector<std::string> kAttachmentColumns = {
  "id", "message_id", "media_type", "filename", "payload", "reference",
  "size", "checksum", "created_at"
};

sqlite3* handle(void* db) { return static_cast<sqlite3*>(db); }

bool isCorruptCode(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

[[noreturn]] void fail(sqlite3* db, int rc, const std::string& row, const std::string& what) {
  const std::string msg = what + ": " + sqlite3_errmsg(db);
  if (isCorruptCode(rc)) throw StoreError(StoreErrc::Corrupt, row, msg);
  throw StoreError(StoreErrc::Io, row, msg);
}

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    if (isCorruptCode(rc)) throw StoreError(StoreErrc::Corrupt, "structured", msg);
    throw StoreError(StoreErrc::Io, "structured", "SQLite exec failed: " + msg);
  }
}

class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    if (rc != SQLITE_OK) fail(db, rc, "structured", std::string("prepare failed for ") + sql);
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bindText(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void bindText(int i, const std::optional<std::string>& v) {
    if (v) bindText(i, *v); else sqlite3_bind_null(st_, i);
  }
  void bindBlob(int i, const std::string& v) {
    sqlite3_bind_blob64(st_, i, v.data(), v.size(), SQLITE_TRANSIENT);
  }
  void bindInt64(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void bindNull(int i) { sqlite3_bind_null(st_, i); }

  // true while a row is available.
  bool step(const std::string& row) {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail(db_, rc, row, "step failed");
  }

  bool isNull(int col) const { return sqlite3_column_type(st_, col) == SQLITE_NULL; }
  int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }
  std::string text(int col) const {
    const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
    return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(st_, col))) : std::string();
  }
  std::optional<std::string> optText(int col) const {
    if (isNull(col)) return std::nullopt;
    return text(col);
  }
  std::string blob(int col) const {
    const void* p = sqlite3_column_blob(st_, col);
    const int n = sqlite3_column_bytes(st_, col);
    return p ? std::string(static_cast<const char*>(p), static_cast<size_t>(n)) : std::string();
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

Timestamp rowTimestamp(const std::string& text, const std::string& row) {
  const auto ts = Timestamp::parse(text);
  if (!ts) {
    throw StoreError(StoreErrc::Corrupt, row, "\"" + text + "\" is not an ISO-8601 instant");
  }
  return *ts;
}

int64_t pragmaInt(sqlite3* db, const char* sql) {
  Statement st(db, sql);
  if (!st.step("structured")) return 0;
  return st.int64(0);
}

std::vector<std::string> tableColumns(sqlite3* db, const std::string& table) {
  const std::string sql = "PRAGMA table_info(" + table + ");";
  Statement st(db, sql.c_str());
  std::vector<std::string> cols;
  while (st.step(table)) cols.push_back(st.text(1));
  return cols;
}

sqlite3* openMemory() {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(":memory:", &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError(StoreErrc::Io, "structured", "Failed to open in-memory DB: " + msg);
  }
  return db;
}

} // namespace

MessageStore::MessageStore(uint32_t schema_version) : db_(nullptr) {
  sqlite3* db = openMemory();
  db_ = db;
  try {
    execAll(db, "PRAGMA application_id=" + std::to_string(kApplicationId) + ";");
    execAll(db, "PRAGMA user_version=" + std::to_string(schema_version) + ";");
    execAll(db, kSchemaSql);
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

MessageStore::MessageStore(std::string_view image) : db_(nullptr) {
  if (image.empty()) {
    throw StoreError(StoreErrc::Corrupt, "structured", "section is empty");
  }
  sqlite3* db = openMemory();
  auto* buf = static_cast<unsigned char*>(sqlite3_malloc64(image.size()));
  if (!buf) {
    sqlite3_close(db);
    throw StoreError(StoreErrc::Io, "structured", "out of memory copying database image");
  }
  std::memcpy(buf, image.data(), image.size());
  const int rc = sqlite3_deserialize(db, "main", buf, static_cast<sqlite3_int64>(image.size()),
                                     static_cast<sqlite3_int64>(image.size()),
                                     SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_RESIZEABLE);
  if (rc != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_close(db);
    throw StoreError(StoreErrc::Corrupt, "structured", "cannot load database image: " + msg);
  }
  db_ = db;
}

MessageStore::~MessageStore() {
  sqlite3_close(handle(db_));
}

void MessageStore::begin() { execAll(handle(db_), "BEGIN;"); }
void MessageStore::commit() { execAll(handle(db_), "COMMIT;"); }
void MessageStore::exec(const std::string& sql) { execAll(handle(db_), sql); }

void MessageStore::insertMessage(const Message& m, int64_t sequence) {
  Statement st(handle(db_), R"SQL(
    INSERT INTO messages (id, sequence, role, content, timestamp, parent_id, metadata)
    VALUES (?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bindText(i++, m.id);
  st.bindInt64(i++, sequence);
  st.bindText(i++, m.role);
  st.bindText(i++, m.content);
  st.bindText(i++, m.timestamp.format());
  st.bindText(i++, m.parent_id);
  if (m.metadata) {
    std::string text;
    try {
      text = m.metadata->dump();
    } catch (const ordered_json::type_error& e) {
      throw StoreError(StoreErrc::Io, "messages/" + m.id + "/metadata", e.what());
    }
    st.bindText(i++, text);
  } else {
    st.bindNull(i++);
  }
  st.step("messages/" + m.id);
}

void MessageStore::insertAttachment(const Attachment& a) {
  Statement st(handle(db_), R"SQL(
    INSERT INTO attachments
      (id, message_id, media_type, filename, payload, reference, size, checksum, created_at)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bindText(i++, a.id);
  st.bindText(i++, a.message_id);
  st.bindText(i++, a.media_type);
  st.bindText(i++, a.filename);
  if (const auto* data = std::get_if<InlineData>(&a.payload)) {
    st.bindBlob(i++, data->bytes);
    st.bindNull(i++);
  } else {
    st.bindNull(i++);
    st.bindText(i++, std::get<ExternalReference>(a.payload).uri);
  }
  if (a.size) st.bindInt64(i++, static_cast<int64_t>(*a.size)); else st.bindNull(i++);
  st.bindText(i++, a.checksum);
  if (a.created_at) st.bindText(i++, a.created_at->format()); else st.bindNull(i++);
  st.step("attachments/" + a.id);
}

std::string MessageStore::image() const {
  sqlite3_int64 size = 0;
  unsigned char* data = sqlite3_serialize(handle(db_), "main", &size, 0);
  if (!data) {
    throw StoreError(StoreErrc::Io, "structured", "sqlite3_serialize returned no image");
  }
  std::string out(reinterpret_cast<const char*>(data), static_cast<size_t>(size));
  sqlite3_free(data);
  return out;
}

void MessageStore::checkIntegrity() {
  Statement st(handle(db_), "PRAGMA integrity_check;");
  std::string report;
  while (st.step("structured")) {
    if (!report.empty()) report += "; ";
    report += st.text(0);
  }
  if (report != "ok") {
    throw StoreError(StoreErrc::Corrupt, "structured", "integrity_check: " + report);
  }
}

void MessageStore::checkSchema(uint32_t expected_version) {
  auto* db = handle(db_);
  const auto app_id = pragmaInt(db, "PRAGMA application_id;");
  if (app_id != kApplicationId) {
    throw StoreError(StoreErrc::SchemaMismatch, "structured",
                     "application_id is " + std::to_string(app_id));
  }
  const auto version = pragmaInt(db, "PRAGMA user_version;");
  if (version != static_cast<int64_t>(expected_version)) {
    throw StoreError(StoreErrc::SchemaMismatch, "structured",
                     "schema version " + std::to_string(version) + ", header declares " +
                     std::to_string(expected_version));
  }
  const std::pair<const char*, const std::vector<std::string>*> tables[] = {
    {"messages", &kMessageColumns}, {"attachments", &kAttachmentColumns}
  };
  for (const auto& [name, expected] : tables) {
    const auto cols = tableColumns(db, name);
    if (cols.empty()) {
      throw StoreError(StoreErrc::SchemaMismatch, name, "table is missing");
    }
    if (std::set<std::string>(cols.begin(), cols.end()) !=
        std::set<std::string>(expected->begin(), expected->end())) {
      throw StoreError(StoreErrc::SchemaMismatch, name, "column set does not match the schema");
    }
  }
}

std::vector<Message> MessageStore::loadMessages() {
  // Physical row order is not meaningful; sequence is.
  Statement st(handle(db_), R"SQL(
    SELECT id, role, content, timestamp, parent_id, metadata
    FROM messages
    ORDER BY sequence
  )SQL");
  std::vector<Message> out;
  while (st.step("messages")) {
    Message m;
    m.id = st.text(0);
    const std::string row = "messages/" + m.id;
    m.role = st.text(1);
    m.content = st.text(2);
    m.timestamp = rowTimestamp(st.text(3), row);
    m.parent_id = st.optText(4);
    if (auto md = st.optText(5)) {
      try {
        m.metadata = ordered_json::parse(*md);
      } catch (const ordered_json::parse_error& e) {
        throw StoreError(StoreErrc::Corrupt, row, std::string("metadata column: ") + e.what());
      }
    }
    out.push_back(std::move(m));
  }
  return out;
}

std::vector<Attachment> MessageStore::loadAttachments() {
  Statement st(handle(db_), R"SQL(
    SELECT id, message_id, media_type, filename, payload, reference, size, checksum, created_at
    FROM attachments
    ORDER BY rowid
  )SQL");
  std::vector<Attachment> out;
  while (st.step("attachments")) {
    Attachment a;
    a.id = st.text(0);
    const std::string row = "attachments/" + a.id;
    a.message_id = st.text(1);
    a.media_type = st.text(2);
    a.filename = st.optText(3);
    const bool has_payload = !st.isNull(4);
    const bool has_reference = !st.isNull(5);
    if (has_payload == has_reference) {
      throw StoreError(StoreErrc::Corrupt, row,
                       "exactly one of payload and reference must be set");
    }
    if (has_payload) a.payload = InlineData{st.blob(4)};
    else             a.payload = ExternalReference{st.text(5)};
    if (!st.isNull(6)) {
      const auto size = st.int64(6);
      if (size < 0) throw StoreError(StoreErrc::Corrupt, row, "negative size");
      a.size = static_cast<uint64_t>(size);
    }
    a.checksum = st.optText(7);
    if (auto created = st.optText(8)) a.created_at = rowTimestamp(*created, row);
    out.push_back(std::move(a));
  }
  return out;
}

std::string writeStore(const std::vector<Message>& messages,
                       const std::vector<Attachment>& attachments,
                       uint32_t schema_version) {
  MessageStore store(schema_version);
  store.begin();
  int64_t sequence = 0;
  for (const auto& m : messages) store.insertMessage(m, sequence++);
  for (const auto& a : attachments) store.insertAttachment(a);
  store.commit();
  auto image = store.image();
  spdlog::debug("structured section: {} messages, {} attachments, {} bytes",
                messages.size(), attachments.size(), image.size());
  return image;
}

StoreContents readStore(std::string_view image, uint32_t expected_schema_version) {
  MessageStore store(image);
  store.checkIntegrity();
  store.checkSchema(expected_schema_version);

  StoreContents out;
  out.messages = store.loadMessages();
  out.attachments = store.loadAttachments();

  std::set<std::string> ids;
  for (const auto& m : out.messages) ids.insert(m.id);
  for (const auto& a : out.attachments) {
    if (!ids.count(a.message_id)) {
      throw StoreError(StoreErrc::OrphanAttachment, "attachments/" + a.id,
                       "references missing message \"" + a.message_id + "\"");
    }
  }
  return out;
}

} // namespace llmd
