#include "utf8.hpp"

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

size_t utf8_next(const std::string& s, size_t pos) {
  if (pos >= s.size()) return s.size();
  ++pos;
  while (pos < s.size() && is_continuation(static_cast<unsigned char>(s[pos]))) ++pos;
  return pos;
}

size_t utf8_prev(const std::string& s, size_t pos) {
  if (pos == 0) return 0;
  if (pos > s.size()) pos = s.size();
  --pos;
  while (pos > 0 && is_continuation(static_cast<unsigned char>(s[pos]))) --pos;
  return pos;
}

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) if (!is_continuation(c)) ++n;
  return n;
}

int utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

std::string utf8_truncate(const std::string& s, int max_cols) {
  if (max_cols <= 0) return std::string();
  size_t pos = 0;
  for (int i = 0; i < max_cols && pos < s.size(); ++i) pos = utf8_next(s, pos);
  return s.substr(0, pos);
}

std::string utf8_skip(const std::string& s, int cols) {
  size_t pos = 0;
  for (int i = 0; i < cols && pos < s.size(); ++i) pos = utf8_next(s, pos);
  return s.substr(pos);
}
