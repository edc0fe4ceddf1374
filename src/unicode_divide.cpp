#include "unicode_divide.hpp"
#include <cwchar>

char32_t next_codepoint(std::string_view s, size_t& i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) { i += 1; return c; }
  int len = 0;
  char32_t cp = 0;
  if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
  else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
  else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
  else { i += 1; return 0xFFFD; }
  if (i + len > s.size()) { i += 1; return 0xFFFD; }
  for (int k = 1; k < len; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) { i += 1; return 0xFFFD; }
    cp = (cp << 6) | (cc & 0x3F);
  }
  i += len;
  return cp;
}

void append_utf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

int char_width(char32_t cp) {
  if (cp >= 0x20 && cp < 0x7F) return 1;
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return -1;
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  // a non-UTF-8 locale knows no width for printable non-ASCII; show it as one column
  return w < 0 ? 1 : w;
}

int display_width(std::string_view s) {
  int w = 0;
  size_t i = 0;
  while (i < s.size()) {
    int cw = char_width(next_codepoint(s, i));
    if (cw > 0) w += cw;
  }
  return w;
}

size_t index_of_width(std::string_view s, size_t width) {
  size_t sum = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t start = i;
    int cw = char_width(next_codepoint(s, i));
    if (cw > 0) sum += static_cast<size_t>(cw);
    if (sum > width) return start;
  }
  return s.size();
}

bool UnicodeStrDivider::next(std::string_view& out) {
  if (pos_ >= inner_.size() || width_ == 0) return false;
  std::string_view rest = inner_.substr(pos_);
  size_t end = index_of_width(rest, width_);
  if (end == 0) {
    // first char alone is wider than the slice
    next_codepoint(rest, end);
  }
  prev_pos_ = pos_;
  pos_ += end;
  out = inner_.substr(prev_pos_, end);
  return true;
}

size_t UnicodeStrDivider::seek_start(size_t cols) {
  pos_ = index_of_width(inner_, cols);
  prev_pos_ = pos_;
  return pos_;
}

size_t UnicodeStrDivider::seek_current(size_t cols) {
  size_t dist = index_of_width(inner_.substr(pos_), cols);
  pos_ += dist;
  prev_pos_ = pos_;
  return dist;
}
