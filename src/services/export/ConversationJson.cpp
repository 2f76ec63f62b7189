#include "ConversationJson.hpp"

#include <openssl/evp.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/metadata/MetadataCodec.hpp"

namespace llmd {

namespace {

// -------- helpers --------

std::string get_s(const ordered_json& j, const char* k, const std::string& where) {
  if (!j.contains(k) || !j[k].is_string()) {
    throw std::runtime_error(where + ": \"" + k + "\" must be a string");
  }
  return j[k].get<std::string>();
}

std::optional<std::string> get_opt_s(const ordered_json& j, const char* k, const std::string& where) {
  if (!j.contains(k) || j[k].is_null()) return std::nullopt;
  return get_s(j, k, where);
}

Timestamp get_ts(const ordered_json& j, const char* k, const std::string& where) {
  const auto text = get_s(j, k, where);
  auto ts = Timestamp::parse(text);
  if (!ts) throw std::runtime_error(where + ": \"" + text + "\" is not an ISO-8601 instant");
  return *ts;
}

ordered_json message_json(const Message& m) {
  ordered_json out = {
    {"id", m.id},
    {"role", m.role},
    {"content", m.content},
    {"timestamp", m.timestamp.format()}
  };
  if (m.parent_id) out["parent_id"] = *m.parent_id;
  if (m.metadata)  out["metadata"] = *m.metadata;
  return out;
}

ordered_json attachment_json(const Attachment& a) {
  ordered_json out = {
    {"id", a.id},
    {"message_id", a.message_id},
    {"media_type", a.media_type}
  };
  if (a.filename) out["filename"] = *a.filename;
  if (const auto* data = std::get_if<InlineData>(&a.payload)) {
    out["data"] = base64_encode(data->bytes);
  } else {
    out["reference"] = std::get<ExternalReference>(a.payload).uri;
  }
  if (a.size)       out["size"] = *a.size;
  if (a.checksum)   out["checksum"] = *a.checksum;
  if (a.created_at) out["created_at"] = a.created_at->format();
  return out;
}

Message message_from(const ordered_json& j, size_t index) {
  const std::string where = "messages[" + std::to_string(index) + "]";
  if (!j.is_object()) throw std::runtime_error(where + " must be an object");
  Message m;
  m.id = get_s(j, "id", where);
  m.role = get_s(j, "role", where);
  m.content = get_s(j, "content", where);
  m.timestamp = get_ts(j, "timestamp", where);
  m.parent_id = get_opt_s(j, "parent_id", where);
  if (j.contains("metadata") && !j["metadata"].is_null()) m.metadata = j["metadata"];
  return m;
}

Attachment attachment_from(const ordered_json& j, size_t index) {
  const std::string where = "attachments[" + std::to_string(index) + "]";
  if (!j.is_object()) throw std::runtime_error(where + " must be an object");
  Attachment a;
  a.id = get_s(j, "id", where);
  a.message_id = get_s(j, "message_id", where);
  a.media_type = get_s(j, "media_type", where);
  a.filename = get_opt_s(j, "filename", where);
  if (j.contains("data")) {
    a.payload = InlineData{base64_decode(get_s(j, "data", where))};
  } else if (j.contains("reference")) {
    a.payload = ExternalReference{get_s(j, "reference", where)};
  } else {
    throw std::runtime_error(where + ": needs \"data\" or \"reference\"");
  }
  if (j.contains("size")) {
    if (!j["size"].is_number_unsigned()) throw std::runtime_error(where + ": \"size\" must be unsigned");
    a.size = j["size"].get<uint64_t>();
  }
  a.checksum = get_opt_s(j, "checksum", where);
  if (j.contains("created_at")) a.created_at = get_ts(j, "created_at", where);
  return a;
}

} // namespace

std::string base64_encode(std::string_view bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  if (bytes.empty()) return out;
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::string base64_decode(std::string_view text) {
  if (text.empty()) return {};
  if (text.size() % 4 != 0) throw std::runtime_error("base64 text length is not a multiple of 4");
  std::string out(3 * (text.size() / 4), '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0) throw std::runtime_error("invalid base64 text");
  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  size_t pad = 0;
  if (text.back() == '=') ++pad;
  if (text.size() > 1 && text[text.size() - 2] == '=') ++pad;
  out.resize(static_cast<size_t>(n) - pad);
  return out;
}

ordered_json conversation_to_json(const Conversation& conversation) {
  ordered_json out = ordered_json::object();
  out["metadata"] = ordered_json::parse(serializeMetadata(conversation.metadata()));
  out["messages"] = ordered_json::array();
  for (const auto& m : conversation.messages()) out["messages"].push_back(message_json(m));
  out["attachments"] = ordered_json::array();
  for (const auto& a : conversation.attachments()) out["attachments"].push_back(attachment_json(a));
  return out;
}

Conversation conversation_from_json(const ordered_json& j) {
  if (!j.is_object() || !j.contains("metadata")) {
    throw std::runtime_error("conversation JSON needs a \"metadata\" object");
  }
  Metadata metadata = deserializeMetadata(j["metadata"].dump());

  std::vector<Message> messages;
  if (j.contains("messages")) {
    if (!j["messages"].is_array()) throw std::runtime_error("\"messages\" must be an array");
    for (size_t i = 0; i < j["messages"].size(); ++i) messages.push_back(message_from(j["messages"][i], i));
  }
  std::vector<Attachment> attachments;
  if (j.contains("attachments")) {
    if (!j["attachments"].is_array()) throw std::runtime_error("\"attachments\" must be an array");
    for (size_t i = 0; i < j["attachments"].size(); ++i) {
      attachments.push_back(attachment_from(j["attachments"][i], i));
    }
  }
  return Conversation(std::move(metadata), std::move(messages), std::move(attachments));
}

} // namespace llmd
