#include "core/Errors.hpp"
#include "core/Llmd.hpp"
#include "services/export/ConversationJson.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using llmd::base64_decode;
using llmd::base64_encode;
using llmd::conversation_from_json;
using llmd::conversation_to_json;
using llmd::ordered_json;
using llmd::tests::ExpectThrow;
using llmd::tests::Require;

const char* kImport = R"({
  "metadata": {
    "version": "0.1",
    "created_at": "2024-01-15T10:30:00Z",
    "participants": ["user", "assistant"],
    "title": "Imported",
    "x-tracking": {"source": "export-v2"}
  },
  "messages": [
    {"id": "msg_1", "role": "user", "content": "Hi", "timestamp": "2024-01-15T10:30:00Z"},
    {"id": "msg_2", "role": "assistant", "content": "Hello", "timestamp": "2024-01-15T10:30:02Z",
     "parent_id": "msg_1", "metadata": {"tokens": 3}}
  ],
  "attachments": [
    {"id": "att_1", "message_id": "msg_1", "media_type": "text/plain", "filename": "a.txt",
     "data": "aGVsbG8=", "size": 5},
    {"id": "att_2", "message_id": "msg_2", "media_type": "image/png",
     "reference": "https://example.invalid/p.png"}
  ]
})";

void ScenarioBase64() {
  llmd::tests::Log("scenario: base64 matches RFC 4648 vectors");
  const std::pair<const char*, const char*> vectors[] = {
    {"", ""}, {"f", "Zg=="}, {"fo", "Zm8="}, {"foo", "Zm9v"}, {"foob", "Zm9vYg=="}, {"fooba", "Zm9vYmE="},
    {"foobar", "Zm9vYmFy"}
  };
  for (const auto& [plain, encoded] : vectors) {
    Require(base64_encode(plain) == encoded, std::string("encode mismatch for ") + plain);
    Require(base64_decode(encoded) == plain, std::string("decode mismatch for ") + encoded);
  }
  const std::string binary("\x00\xff\x00", 3);
  Require(base64_decode(base64_encode(binary)) == binary, "binary bytes not preserved");
  ExpectThrow<std::runtime_error>("bad_length", []() { (void)base64_decode("abc"); });
}

void ScenarioImport() {
  llmd::tests::Log("scenario: JSON import builds a writable conversation");
  const auto conv = conversation_from_json(ordered_json::parse(kImport));
  Require(conv.metadata().title == std::string("Imported"), "title");
  Require(conv.metadata().extensions.contains("x-tracking"), "extension not kept");
  Require(conv.messages().size() == 2, "message count");
  Require(conv.messages()[1].parent_id == std::string("msg_1"), "parent_id");
  Require(conv.attachments().size() == 2, "attachment count");
  Require(conv.attachments()[0].isInline(), "data attachment not inline");
  Require(std::get<llmd::InlineData>(conv.attachments()[0].payload).bytes == "hello", "decoded payload");
  Require(!conv.attachments()[1].isInline(), "reference attachment inline");

  const auto reparsed = llmd::parseBytes(llmd::writeBytes(conv));
  Require(reparsed == conv, "imported conversation changed through the file format");
}

void ScenarioExport() {
  llmd::tests::Log("scenario: export mirrors import");
  const auto conv = conversation_from_json(ordered_json::parse(kImport));
  const auto j = conversation_to_json(conv);
  Require(j["metadata"]["x-tracking"]["source"] == "export-v2", "extension not exported");
  Require(j["messages"][1]["metadata"]["tokens"] == 3, "message metadata not exported");
  Require(j["attachments"][0]["data"] == "aGVsbG8=", "inline payload not base64");
  Require(j["attachments"][1]["reference"] == "https://example.invalid/p.png", "reference not exported");
  Require(!j["messages"][0].contains("parent_id"), "absent parent_id exported");
  Require(conversation_from_json(j) == conv, "export does not import back");
}

void ScenarioImportErrors() {
  llmd::tests::Log("scenario: malformed import input names the offending field");
  auto missing_content = ordered_json::parse(kImport);
  missing_content["messages"][0].erase("content");
  ExpectThrow<std::runtime_error>(
      "missing_content", [&]() { (void)conversation_from_json(missing_content); },
      [](const std::runtime_error& e) { return std::string(e.what()).find("messages[0]") != std::string::npos; });

  auto no_payload = ordered_json::parse(kImport);
  no_payload["attachments"][1].erase("reference");
  ExpectThrow<std::runtime_error>(
      "no_payload", [&]() { (void)conversation_from_json(no_payload); },
      [](const std::runtime_error& e) { return std::string(e.what()).find("attachments[1]") != std::string::npos; });

  auto bad_metadata = ordered_json::parse(kImport);
  bad_metadata["metadata"].erase("created_at");
  ExpectThrow<llmd::MetadataError>(
      "bad_metadata", [&]() { (void)conversation_from_json(bad_metadata); },
      [](const llmd::MetadataError& e) { return e.code() == llmd::MetadataErrc::MissingRequiredField; });

  ExpectThrow<std::runtime_error>("not_object", []() { (void)conversation_from_json(ordered_json::array()); });
}

}  // namespace

int main() {
  try {
    llmd::tests::Log("conversation_json_test: start");
    ScenarioBase64();
    ScenarioImport();
    ScenarioExport();
    ScenarioImportErrors();
    llmd::tests::Log("conversation_json_test: finished");
    std::cout << "conversation_json_test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    llmd::tests::LogError(ex.what());
    std::cerr << "conversation_json_test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
