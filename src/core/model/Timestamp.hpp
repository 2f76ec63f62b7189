#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace llmd {

// An absolute instant parsed from ISO-8601 text. Keeps the UTC offset it
// was written with so format() reproduces the canonical form.
class Timestamp {
public:
  Timestamp() = default;

  // "YYYY-MM-DDTHH:MM:SS[.ffffff](Z|+HH:MM|-HH:MM)"; a zone designator is
  // required. Returns nullopt on anything else.
  static std::optional<Timestamp> parse(std::string_view text);
  // Throws std::out_of_range when the local time falls outside years
  // 0000-9999 or the offset exceeds 23:59.
  static Timestamp fromUnixMicros(int64_t micros, int offset_minutes = 0);
  static Timestamp now();

  int64_t unixMicros() const { return micros_; }
  int offsetMinutes() const { return offset_minutes_; }

  std::string format() const;

  bool operator==(const Timestamp& o) const { return micros_ == o.micros_; }
  bool operator!=(const Timestamp& o) const { return micros_ != o.micros_; }
  bool operator<(const Timestamp& o) const { return micros_ < o.micros_; }
  bool operator<=(const Timestamp& o) const { return micros_ <= o.micros_; }
  bool operator>(const Timestamp& o) const { return micros_ > o.micros_; }

private:
  Timestamp(int64_t micros, int offset_minutes)
    : micros_(micros), offset_minutes_(offset_minutes) {}

  int64_t micros_ = 0;
  int offset_minutes_ = 0;
};

} // namespace llmd
