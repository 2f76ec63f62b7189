#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "core/Errors.hpp"
#include "core/io/Parser.hpp"
#include "core/io/Writer.hpp"
#include "core/model/Conversation.hpp"

// Convenience entry points. Each call uses its own Parser or Writer, so
// independent parses and writes never share state.
namespace llmd {

inline Conversation parseFile(const std::filesystem::path& path, ParserOptions options = {}) {
  return Parser(std::move(options)).parseFile(path);
}

inline Conversation parseBytes(std::string_view bytes, ParserOptions options = {}) {
  return Parser(std::move(options)).parseBytes(bytes);
}

inline void writeFile(const Conversation& conversation, const std::filesystem::path& path,
                      WriterOptions options = {}) {
  Writer(std::move(options)).writeFile(conversation, path);
}

inline std::string writeBytes(const Conversation& conversation, WriterOptions options = {}) {
  return Writer(std::move(options)).writeBytes(conversation);
}

} // namespace llmd
