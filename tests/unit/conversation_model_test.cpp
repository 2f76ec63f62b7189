#include "core/format/Digest.hpp"
#include "core/model/Conversation.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace {

using llmd::Attachment;
using llmd::Conversation;
using llmd::InlineData;
using llmd::Message;
using llmd::Timestamp;
using llmd::tests::Require;

Message MakeMessage(const std::string& id, const std::string& role, const std::string& content, int64_t second) {
  Message m;
  m.id = id;
  m.role = role;
  m.content = content;
  m.timestamp = Timestamp::fromUnixMicros(1705314600LL * 1000000 + second * 1000000);
  return m;
}

void ScenarioCreate() {
  llmd::tests::Log("scenario: create stamps version and creation time");
  const auto before = Timestamp::now();
  const auto conv = Conversation::create({"user", "assistant"}, std::string("Title"));
  Require(conv.metadata().version == llmd::kMetadataVersion, "version not defaulted");
  Require(conv.metadata().participants.size() == 2, "participants not kept");
  Require(conv.metadata().title == std::string("Title"), "title not kept");
  Require(before <= conv.metadata().created_at, "created_at precedes creation");
  Require(conv.messages().empty() && conv.attachments().empty(), "new conversation not empty");
}

void ScenarioNewId() {
  llmd::tests::Log("scenario: generated ids are distinct UUIDv4 text");
  std::set<std::string> ids;
  for (int i = 0; i < 64; ++i) {
    const auto id = Conversation::newId();
    Require(id.size() == 36, "id length is not 36: " + id);
    Require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-', "dash layout: " + id);
    Require(id[14] == '4', "version nibble is not 4: " + id);
    Require(std::string("89ab").find(id[19]) != std::string::npos, "variant nibble: " + id);
    ids.insert(id);
  }
  Require(ids.size() == 64, "duplicate ids generated");
}

void ScenarioAppendAndFind() {
  llmd::tests::Log("scenario: append keeps turn order and fills empty ids");
  auto conv = Conversation::create({"user", "assistant"});
  conv.appendMessage(MakeMessage("msg_1", "user", "Hello", 0));
  conv.appendMessage(MakeMessage("", "assistant", "Hi", 5));
  auto& third = conv.appendMessage("user", "Thanks");

  Require(conv.messages().size() == 3, "message count");
  Require(conv.messages()[0].id == "msg_1", "first message id changed");
  Require(!conv.messages()[1].id.empty(), "empty id not replaced");
  Require(third.role == "user" && third.content == "Thanks", "role/content append");
  Require(conv.findMessage("msg_1") != nullptr, "findMessage missed existing id");
  Require(conv.findMessage("nope") == nullptr, "findMessage found missing id");

  Message edited = conv.messages()[0];
  edited.content = "Hello again";
  Require(conv.updateMessage(edited), "update of existing message failed");
  Require(conv.messages()[0].content == "Hello again", "update not applied");
  Require(!conv.updateMessage(MakeMessage("ghost", "user", "x", 0)), "update of missing message succeeded");
}

void ScenarioAttachments() {
  llmd::tests::Log("scenario: inline attachments get size and checksum; removal cascades");
  auto conv = Conversation::create({"user"});
  conv.appendMessage(MakeMessage("msg_1", "user", "see file", 0));
  conv.appendMessage(MakeMessage("msg_2", "user", "and this", 1));

  Attachment a;
  a.media_type = "text/plain";
  a.payload = InlineData{"hello"};
  const auto& added = conv.addAttachment("msg_1", a);
  Require(added.message_id == "msg_1", "owner not set");
  Require(!added.id.empty(), "attachment id not generated");
  Require(added.size == 5u, "size not filled");
  Require(added.checksum == llmd::attachment_checksum("hello"), "checksum not filled");
  Require(added.checksum->rfind("sha256:", 0) == 0, "checksum is not sha256 form");

  Attachment ref;
  ref.id = "att_ref";
  ref.media_type = "image/png";
  ref.payload = llmd::ExternalReference{"https://example.invalid/cat.png"};
  conv.addAttachment("msg_2", ref);
  Require(!conv.attachments()[1].size.has_value(), "reference attachment gained a size");

  Require(conv.attachmentsFor("msg_1").size() == 1, "attachmentsFor msg_1");
  Require(conv.removeMessage("msg_1"), "remove failed");
  Require(conv.attachmentsFor("msg_1").empty(), "owned attachment not removed");
  Require(conv.attachments().size() == 1 && conv.attachments()[0].id == "att_ref", "other attachment lost");
  Require(!conv.removeMessage("msg_1"), "second remove succeeded");
}

void ScenarioDigest() {
  llmd::tests::Log("scenario: sha256 of a known input");
  Require(llmd::sha256_hex("abc") ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
          "sha256(abc) mismatch");
  Require(llmd::attachment_checksum("") ==
              "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
          "sha256 of empty input mismatch");
}

}  // namespace

int main() {
  try {
    llmd::tests::Log("conversation_model_test: start");
    ScenarioCreate();
    ScenarioNewId();
    ScenarioAppendAndFind();
    ScenarioAttachments();
    ScenarioDigest();
    llmd::tests::Log("conversation_model_test: finished");
    std::cout << "conversation_model_test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    llmd::tests::LogError(ex.what());
    std::cerr << "conversation_model_test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
