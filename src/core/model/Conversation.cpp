#include "Conversation.hpp"

#include <algorithm>
#include <random>
#include <utility>

#include "core/format/Digest.hpp"

namespace llmd {

bool isKnownRole(std::string_view role) {
  return role == "user" || role == "assistant" || role == "system" ||
         role == "function" || role == "tool";
}

bool operator==(const Metadata& a, const Metadata& b) {
  return a.version == b.version && a.created_at == b.created_at &&
         a.participants == b.participants && a.title == b.title &&
         a.description == b.description && a.tags == b.tags &&
         a.language == b.language && a.model_info == b.model_info &&
         a.extensions == b.extensions;
}

bool operator==(const Message& a, const Message& b) {
  return a.id == b.id && a.role == b.role && a.content == b.content &&
         a.timestamp == b.timestamp && a.parent_id == b.parent_id &&
         a.metadata == b.metadata;
}

bool operator==(const Attachment& a, const Attachment& b) {
  if (a.isInline() != b.isInline()) return false;
  const bool same_payload = a.isInline()
    ? std::get<InlineData>(a.payload).bytes == std::get<InlineData>(b.payload).bytes
    : std::get<ExternalReference>(a.payload).uri == std::get<ExternalReference>(b.payload).uri;
  return same_payload && a.id == b.id && a.message_id == b.message_id &&
         a.media_type == b.media_type && a.filename == b.filename &&
         a.size == b.size && a.checksum == b.checksum && a.created_at == b.created_at;
}

bool operator==(const Conversation& a, const Conversation& b) {
  return a.metadata() == b.metadata() && a.messages() == b.messages() &&
         a.attachments() == b.attachments();
}

Conversation::Conversation(Metadata metadata)
  : metadata_(std::move(metadata)) {}

Conversation::Conversation(Metadata metadata, std::vector<Message> messages,
                           std::vector<Attachment> attachments)
  : metadata_(std::move(metadata)),
    messages_(std::move(messages)),
    attachments_(std::move(attachments)) {}

Conversation Conversation::create(std::vector<std::string> participants,
                                  std::optional<std::string> title) {
  Metadata md;
  md.created_at = Timestamp::now();
  md.participants = std::move(participants);
  md.title = std::move(title);
  return Conversation(std::move(md));
}

std::string Conversation::newId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto rnd64 = [&]() { return static_cast<uint64_t>(rng()); };
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rnd64(), b = rnd64();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx...
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

const Message* Conversation::findMessage(const std::string& id) const {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const Message& m) { return m.id == id; });
  return it == messages_.end() ? nullptr : &*it;
}

std::vector<const Attachment*> Conversation::attachmentsFor(const std::string& message_id) const {
  std::vector<const Attachment*> out;
  for (const auto& a : attachments_) {
    if (a.message_id == message_id) out.push_back(&a);
  }
  return out;
}

Message& Conversation::appendMessage(Message message) {
  if (message.id.empty()) message.id = newId();
  messages_.push_back(std::move(message));
  return messages_.back();
}

Message& Conversation::appendMessage(std::string role, std::string content) {
  Message m;
  m.role = std::move(role);
  m.content = std::move(content);
  m.timestamp = Timestamp::now();
  return appendMessage(std::move(m));
}

bool Conversation::updateMessage(const Message& message) {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const Message& m) { return m.id == message.id; });
  if (it == messages_.end()) return false;
  *it = message;
  return true;
}

bool Conversation::removeMessage(const std::string& id) {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const Message& m) { return m.id == id; });
  if (it == messages_.end()) return false;
  messages_.erase(it);
  attachments_.erase(std::remove_if(attachments_.begin(), attachments_.end(),
                                    [&](const Attachment& a) { return a.message_id == id; }),
                     attachments_.end());
  return true;
}

Attachment& Conversation::addAttachment(const std::string& message_id, Attachment attachment) {
  attachment.message_id = message_id;
  if (attachment.id.empty()) attachment.id = newId();
  if (const auto* data = std::get_if<InlineData>(&attachment.payload)) {
    if (!attachment.size) attachment.size = data->bytes.size();
    if (!attachment.checksum) attachment.checksum = attachment_checksum(data->bytes);
  }
  attachments_.push_back(std::move(attachment));
  return attachments_.back();
}

} // namespace llmd
