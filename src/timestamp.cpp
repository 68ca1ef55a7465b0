#include "timestamp.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

using namespace std::chrono;

Timestamp now_timestamp() {
  return time_point_cast<nanoseconds>(system_clock::now());
}

static int local_offset_at(Timestamp t) {
  std::time_t tt = static_cast<std::time_t>(floor<seconds>(t.time_since_epoch()).count());
  std::tm tm{};
  if (!::localtime_r(&tt, &tm)) return 0;
  return static_cast<int>(tm.tm_gmtoff);
}

std::string format_timestamp(Timestamp t, int offset_seconds) {
  auto since = t.time_since_epoch() + seconds(offset_seconds);
  auto secs = floor<seconds>(since);
  long long nanos = (since - secs).count();
  sys_days day = floor<days>(sys_seconds(secs));
  year_month_day ymd(day);
  hh_mm_ss<seconds> hms(sys_seconds(secs) - day);

  char head[32];
  std::snprintf(head, sizeof(head), "%04d-%02u-%02uT%02d:%02d:%02d",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  std::string out = head;
  if (nanos != 0) {
    char frac[16];
    std::snprintf(frac, sizeof(frac), "%09lld", nanos);
    std::string f = frac;
    while (!f.empty() && f.back() == '0') f.pop_back();
    out += "." + f;
  }
  if (offset_seconds == 0) {
    out += "Z";
  } else {
    int off = offset_seconds < 0 ? -offset_seconds : offset_seconds;
    char zone[8];
    std::snprintf(zone, sizeof(zone), "%c%02d:%02d", offset_seconds < 0 ? '-' : '+', off / 3600, (off % 3600) / 60);
    out += zone;
  }
  return out;
}

std::string format_timestamp(Timestamp t) {
  return format_timestamp(t, local_offset_at(t));
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (!std::isdigit(c)) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

bool parse_timestamp(const std::string& text, Timestamp& out, std::string& msg) {
  auto fail = [&](const char* why) {
    msg = std::string("bad timestamp \"") + text + "\": " + why;
    return false;
  };
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, se = 0;
  if (!read_digits(text, 0, 4, y) || text.size() < 19) return fail("expected YYYY-MM-DDTHH:MM:SS");
  if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':')
    return fail("expected YYYY-MM-DDTHH:MM:SS");
  if (!read_digits(text, 5, 2, mo) || !read_digits(text, 8, 2, d) || !read_digits(text, 11, 2, h) ||
      !read_digits(text, 14, 2, mi) || !read_digits(text, 17, 2, se))
    return fail("expected YYYY-MM-DDTHH:MM:SS");
  year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return fail("date out of range");
  if (h > 23 || mi > 59 || se > 59) return fail("time out of range");

  size_t pos = 19;
  long long nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    size_t n = pos - start;
    if (n == 0 || n > 9) return fail("fraction must have 1 to 9 digits");
    for (size_t i = 0; i < 9; ++i) nanos = nanos * 10 + (i < n ? text[start + i] - '0' : 0);
  }

  int offset = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int oh = 0, om = 0;
    if (!read_digits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
        !read_digits(text, pos + 4, 2, om))
      return fail("expected zone offset +HH:MM");
    if (oh > 23 || om > 59) return fail("zone offset out of range");
    offset = (oh * 3600 + om * 60) * (text[pos] == '-' ? -1 : 1);
    pos += 6;
  } else {
    return fail("missing zone designator");
  }
  if (pos != text.size()) return fail("trailing characters");

  auto wall = sys_days(ymd).time_since_epoch() + hours(h) + minutes(mi) + seconds(se);
  out = Timestamp(duration_cast<nanoseconds>(wall - seconds(offset)) + nanoseconds(nanos));
  return true;
}
