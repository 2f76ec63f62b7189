#include "Timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace llmd {
namespace {

constexpr int64_t kMicrosPerSecond = 1000000;

// Howard Hinnant's civil-calendar conversions.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

bool is_leap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned k[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : k[m - 1];
}

class Scanner {
public:
  explicit Scanner(std::string_view s) : s_(s) {}

  bool digits(size_t n, int64_t& out) {
    if (pos_ + n > s_.size()) return false;
    int64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
      const char c = s_[pos_ + i];
      if (c < '0' || c > '9') return false;
      v = v * 10 + (c - '0');
    }
    pos_ += n;
    out = v;
    return true;
  }

  bool lit(char c) {
    if (pos_ < s_.size() && s_[pos_] == c) { ++pos_; return true; }
    return false;
  }

  bool peekDigit() const { return pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9'; }
  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
  void skip() { ++pos_; }
  bool done() const { return pos_ == s_.size(); }

private:
  std::string_view s_;
  size_t pos_ = 0;
};

} // namespace

std::optional<Timestamp> Timestamp::parse(std::string_view text) {
  Scanner sc(text);
  int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!sc.digits(4, year) || !sc.lit('-') || !sc.digits(2, month) || !sc.lit('-') ||
      !sc.digits(2, day)) {
    return std::nullopt;
  }
  if (!(sc.lit('T') || sc.lit('t') || sc.lit(' '))) return std::nullopt;
  if (!sc.digits(2, hour) || !sc.lit(':') || !sc.digits(2, minute) || !sc.lit(':') ||
      !sc.digits(2, second)) {
    return std::nullopt;
  }

  int64_t fraction = 0;
  if (sc.lit('.') || sc.lit(',')) {
    if (!sc.peekDigit()) return std::nullopt;
    int64_t scale = 100000;
    while (sc.peekDigit()) {
      int64_t digit = 0;
      sc.digits(1, digit);
      fraction += digit * scale;
      scale /= 10;
    }
  }

  int offset = 0;
  const char zone = sc.peek();
  if (zone == 'Z' || zone == 'z') {
    sc.skip();
  } else if (zone == '+' || zone == '-') {
    sc.skip();
    int64_t oh = 0, om = 0;
    if (!sc.digits(2, oh) || !sc.lit(':') || !sc.digits(2, om) || oh > 23 || om > 59) {
      return std::nullopt;
    }
    offset = static_cast<int>(oh * 60 + om) * (zone == '-' ? -1 : 1);
  } else {
    return std::nullopt;
  }
  if (!sc.done()) return std::nullopt;

  if (month < 1 || month > 12 || day < 1 ||
      day > days_in_month(year, static_cast<unsigned>(month)) ||
      hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t local_seconds = days * 86400 + hour * 3600 + minute * 60 + second;
  const int64_t utc_seconds = local_seconds - static_cast<int64_t>(offset) * 60;
  return Timestamp(utc_seconds * kMicrosPerSecond + fraction, offset);
}

Timestamp Timestamp::fromUnixMicros(int64_t micros, int offset_minutes) {
  constexpr int kMaxOffset = 23 * 60 + 59;
  if (offset_minutes < -kMaxOffset || offset_minutes > kMaxOffset) {
    throw std::out_of_range("UTC offset of " + std::to_string(offset_minutes) + " minutes");
  }
  // parse() only reads four-digit years, so format() must never produce more.
  static const int64_t kFirst = days_from_civil(0, 1, 1) * 86400 * kMicrosPerSecond;
  static const int64_t kEnd = days_from_civil(10000, 1, 1) * 86400 * kMicrosPerSecond;
  const int64_t day = 86400 * kMicrosPerSecond;
  const bool near = micros >= kFirst - day && micros < kEnd + day;
  const int64_t local = near ? micros + static_cast<int64_t>(offset_minutes) * 60 * kMicrosPerSecond : 0;
  if (!near || local < kFirst || local >= kEnd) {
    throw std::out_of_range("instant " + std::to_string(micros) + "us lies outside years 0000-9999");
  }
  return Timestamp(micros, offset_minutes);
}

Timestamp Timestamp::now() {
  using namespace std::chrono;
  const auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
  return Timestamp(static_cast<int64_t>(us), 0);
}

std::string Timestamp::format() const {
  const int64_t local = micros_ + static_cast<int64_t>(offset_minutes_) * 60 * kMicrosPerSecond;
  int64_t seconds = local / kMicrosPerSecond;
  int64_t fraction = local % kMicrosPerSecond;
  if (fraction < 0) { fraction += kMicrosPerSecond; --seconds; }
  int64_t days = seconds / 86400;
  int64_t rem = seconds % 86400;
  if (rem < 0) { rem += 86400; --days; }

  int64_t y = 0; unsigned m = 0, d = 0;
  civil_from_days(days, y, m, d);

  char buf[64];
  int n = std::snprintf(buf, sizeof buf, "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
                        static_cast<long long>(y), m, d,
                        static_cast<long long>(rem / 3600),
                        static_cast<long long>((rem % 3600) / 60),
                        static_cast<long long>(rem % 60));
  std::string out(buf, static_cast<size_t>(n));

  if (fraction != 0) {
    std::snprintf(buf, sizeof buf, ".%06lld", static_cast<long long>(fraction));
    std::string frac(buf);
    while (frac.back() == '0') frac.pop_back();
    out += frac;
  }

  if (offset_minutes_ == 0) {
    out += 'Z';
  } else {
    const int abs = offset_minutes_ < 0 ? -offset_minutes_ : offset_minutes_;
    std::snprintf(buf, sizeof buf, "%c%02d:%02d", offset_minutes_ < 0 ? '-' : '+', abs / 60, abs % 60);
    out += buf;
  }
  return out;
}

} // namespace llmd
