#include "MetadataCodec.hpp"

#include <cctype>
#include <set>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace llmd {
namespace {

const char* const kRecognised[] = {
  "version", "created_at", "participants", "title",
  "description", "tags", "language", "model_info"
};

bool isRecognised(const std::string& key) {
  for (const char* k : kRecognised) {
    if (key == k) return true;
  }
  return false;
}

std::string_view trimSection(std::string_view text) {
  size_t b = 0;
  while (b < text.size() && (text[b] == '\0' || std::isspace(static_cast<unsigned char>(text[b])))) ++b;
  size_t e = text.size();
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  return text.substr(b, e - b);
}

std::string requireString(const ordered_json& v, const std::string& key) {
  if (!v.is_string()) {
    throw MetadataError(MetadataErrc::WrongType, key,
                        "expected a string, got " + std::string(v.type_name()));
  }
  return v.get<std::string>();
}

std::vector<std::string> readTags(const ordered_json& v) {
  if (!v.is_array()) {
    throw MetadataError(MetadataErrc::WrongType, "tags",
                        "expected an array, got " + std::string(v.type_name()));
  }
  std::vector<std::string> out;
  for (const auto& t : v) out.push_back(requireString(t, "tags"));
  return out;
}

// Participants are strings; objects carrying a "role" are reduced to it.
std::vector<std::string> readParticipants(const ordered_json& v) {
  if (!v.is_array()) {
    throw MetadataError(MetadataErrc::WrongType, "participants",
                        "expected an array, got " + std::string(v.type_name()));
  }
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& p : v) {
    std::string name;
    if (p.is_object() && p.contains("role")) {
      name = requireString(p["role"], "participants");
    } else {
      name = requireString(p, "participants");
    }
    if (!seen.insert(name).second) {
      throw MetadataError(MetadataErrc::DuplicateParticipant, "participants",
                          "\"" + name + "\" is listed more than once");
    }
    out.push_back(std::move(name));
  }
  return out;
}

// dump() refuses strings that are not valid UTF-8; report the key holding one.
std::string dumpSection(const ordered_json& j) {
  try {
    return j.dump(2) + "\n";
  } catch (const ordered_json::type_error& e) {
    for (const auto& [key, value] : j.items()) {
      try {
        (void)value.dump();
      } catch (const ordered_json::type_error&) {
        throw MetadataError(MetadataErrc::WrongType, key, e.what());
      }
    }
    throw MetadataError(MetadataErrc::WrongType, "metadata", e.what());
  }
}

} // namespace

std::string serializeMetadata(const Metadata& md) {
  ordered_json j = ordered_json::object();
  j["version"] = md.version;
  j["created_at"] = md.created_at.format();
  j["participants"] = md.participants;
  if (md.title)       j["title"] = *md.title;
  if (md.description) j["description"] = *md.description;
  if (md.tags)        j["tags"] = *md.tags;
  if (md.language)    j["language"] = *md.language;
  if (md.model_info)  j["model_info"] = *md.model_info;

  if (md.extensions.is_object()) {
    for (const auto& [key, value] : md.extensions.items()) {
      if (isRecognised(key)) {
        spdlog::warn("metadata extension \"{}\" shadows a recognised key; dropped", key);
        continue;
      }
      j[key] = value;
    }
  }
  return dumpSection(j);
}

Metadata deserializeMetadata(std::string_view text) {
  const auto body = trimSection(text);

  ordered_json j;
  try {
    j = ordered_json::parse(body.begin(), body.end());
  } catch (const ordered_json::parse_error& e) {
    throw MetadataError(MetadataErrc::SyntaxError, "metadata", e.what());
  }
  if (!j.is_object()) {
    throw MetadataError(MetadataErrc::SyntaxError, "metadata",
                        "top level must be an object, got " + std::string(j.type_name()));
  }

  // Older producers wrote these spellings.
  if (j.contains("llmd_version") && !j.contains("version")) {
    j["version"] = j["llmd_version"];
    j.erase("llmd_version");
  }
  if (j.contains("created") && !j.contains("created_at")) {
    j["created_at"] = j["created"];
    j.erase("created");
  }

  for (const char* key : {"version", "created_at", "participants"}) {
    if (!j.contains(key)) {
      throw MetadataError(MetadataErrc::MissingRequiredField, key, "required key is absent");
    }
  }

  Metadata md;
  md.version = requireString(j["version"], "version");

  const auto created = requireString(j["created_at"], "created_at");
  const auto ts = Timestamp::parse(created);
  if (!ts) {
    throw MetadataError(MetadataErrc::MalformedTimestamp, "created_at",
                        "\"" + created + "\" is not an ISO-8601 instant");
  }
  md.created_at = *ts;
  md.participants = readParticipants(j["participants"]);

  if (j.contains("title"))       md.title = requireString(j["title"], "title");
  if (j.contains("description")) md.description = requireString(j["description"], "description");
  if (j.contains("tags"))        md.tags = readTags(j["tags"]);
  if (j.contains("language"))    md.language = requireString(j["language"], "language");
  if (j.contains("model_info")) {
    if (!j["model_info"].is_object()) {
      throw MetadataError(MetadataErrc::WrongType, "model_info",
                          "expected an object, got " + std::string(j["model_info"].type_name()));
    }
    md.model_info = j["model_info"];
  }

  for (const auto& [key, value] : j.items()) {
    if (!isRecognised(key)) md.extensions[key] = value;
  }
  return md;
}

} // namespace llmd
