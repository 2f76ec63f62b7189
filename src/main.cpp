// src/main.cpp
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "core/Llmd.hpp"
#include "core/format/Digest.hpp"
#include "services/export/ConversationJson.hpp"

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static bool env_flag(const char* key) {
  std::string v = get_env_or(key, "");
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

static void configure_logging() {
  const std::string level = get_env_or("LLMD_LOG_LEVEL", "info");
  spdlog::set_level(spdlog::level::from_str(level));
}

static llmd::ParserOptions parser_options_from_env() {
  llmd::ParserOptions opts;
  if (env_flag("LLMD_STRICT")) opts.timestamps = llmd::TimestampPolicy::Strict;
  if (env_flag("LLMD_ALLOW_ANY_ROLE")) {
    opts.accept_role = [](const std::string& role) { return !role.empty(); };
  }
  return opts;
}

static llmd::WriterOptions writer_options_from_env() {
  llmd::WriterOptions opts;
  if (env_flag("LLMD_ALLOW_ANY_ROLE")) {
    opts.accept_role = [](const std::string& role) { return !role.empty(); };
  }
  return opts;
}

static llmd::Conversation sample_conversation() {
  auto conv = llmd::Conversation::create({"user", "assistant"}, std::string("Sample Conversation"));
  auto& md = conv.metadata();
  md.description = "A sample conversation stored in the LLMD format";
  md.tags = std::vector<std::string>{"demo", "sample"};
  md.language = "en";

  const auto t0 = md.created_at.unixMicros();
  auto add = [&](const char* id, const char* role, const char* content, int seconds) {
    llmd::Message m;
    m.id = id;
    m.role = role;
    m.content = content;
    m.timestamp = llmd::Timestamp::fromUnixMicros(t0 + seconds * 1000000LL);
    conv.appendMessage(std::move(m));
  };
  add("msg_001", "user", "Hello! Can you help me understand the LLMD format?", 0);
  add("msg_002", "assistant",
      "LLMD stores a conversation in one file: a fixed binary header, a JSON metadata "
      "section and an SQLite database holding the ordered messages and attachments.", 5);
  add("msg_003", "user", "Here is a note to keep with it.", 10);

  llmd::Attachment note;
  note.media_type = "text/plain";
  note.filename = "note.txt";
  note.payload = llmd::InlineData{"remember to check the header checksums\n"};
  conv.addAttachment("msg_003", std::move(note));
  return conv;
}

static void print_info(const std::string& path) {
  llmd::Parser parser(parser_options_from_env());
  const auto conv = parser.parseFile(path);
  const auto& h = *parser.header();
  const auto& md = conv.metadata();
  std::cout << "file:              " << path << "\n"
            << "container version: " << static_cast<int>(h.version) << "\n"
            << "schema version:    " << h.schema_version << "\n"
            << "metadata section:  offset " << h.metadata.offset << ", " << h.metadata.length << " bytes"
            << (h.metadata_checksum ? ", sha256 " + llmd::to_hex(h.metadata_checksum->data(), 32) : "") << "\n"
            << "structured section: offset " << h.structured.offset << ", " << h.structured.length << " bytes"
            << (h.structured_checksum ? ", sha256 " + llmd::to_hex(h.structured_checksum->data(), 32) : "") << "\n"
            << "version:           " << md.version << "\n"
            << "created_at:        " << md.created_at.format() << "\n"
            << "title:             " << md.title.value_or("(none)") << "\n"
            << "participants:      " << md.participants.size() << "\n"
            << "messages:          " << conv.messages().size() << "\n"
            << "attachments:       " << conv.attachments().size() << "\n";
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --info <file>            # header and counts\n"
            << "  " << argv0 << " --validate <file>        # strict parse, exit 0 when valid\n"
            << "  " << argv0 << " --dump <file>            # conversation as JSON\n"
            << "  " << argv0 << " --import <json> <file>   # JSON conversation -> LLMD file\n"
            << "  " << argv0 << " --sample <file>          # write a demo conversation\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    configure_logging();
    const std::string cmd = argc > 1 ? argv[1] : "";

    if (cmd == "--info" && argc == 3) {
      print_info(argv[2]);
      return 0;
    }

    if (cmd == "--validate" && argc == 3) {
      auto opts = parser_options_from_env();
      opts.timestamps = llmd::TimestampPolicy::Strict;
      const auto conv = llmd::parseFile(argv[2], opts);
      std::cout << argv[2] << ": ok (" << conv.messages().size() << " messages)\n";
      return 0;
    }

    if (cmd == "--dump" && argc == 3) {
      const auto conv = llmd::parseFile(argv[2], parser_options_from_env());
      std::cout << llmd::conversation_to_json(conv).dump(2) << "\n";
      return 0;
    }

    if (cmd == "--import" && argc == 4) {
      std::ifstream in(argv[2]);
      if (!in) throw std::runtime_error(std::string("Cannot open JSON file: ") + argv[2]);
      std::ostringstream buf; buf << in.rdbuf();
      const auto conv = llmd::conversation_from_json(llmd::ordered_json::parse(buf.str()));
      llmd::writeFile(conv, argv[3], writer_options_from_env());
      return 0;
    }

    if (cmd == "--sample" && argc == 3) {
      llmd::writeFile(sample_conversation(), argv[2]);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
