#pragma once
/*
 * Unicode helpers
 *
 * Purpose: display-width aware slicing of UTF-8 lines for the pane.
 * Note: widths come from wcwidth() in a UTF-8 locale (main switches LC_CTYPE
 *       to C.UTF-8 when needed). C0/C1 controls report -1; any other char
 *       wcwidth does not know counts as 1 column.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

// Decode one code point at s[i] and advance i. Invalid bytes decode as U+FFFD.
char32_t next_codepoint(std::string_view s, size_t& i);
void append_utf8(std::string& out, char32_t cp);

int char_width(char32_t cp);
int display_width(std::string_view s);

// Byte index of the first char that makes the width exceed `width`,
// or s.size() when the whole string fits.
size_t index_of_width(std::string_view s, size_t width);

class UnicodeStrDivider {
public:
  UnicodeStrDivider(std::string_view line, size_t width) : inner_(line), width_(width) {}

  // Next slice of at most `width` columns. Always advances at least one char
  // when width > 0, so a char wider than the slice still makes progress.
  bool next(std::string_view& out);
  std::pair<size_t, size_t> last_range() const { return {prev_pos_, pos_}; }

  size_t seek_start(size_t cols);
  size_t seek_current(size_t cols);
  size_t pos() const { return pos_; }

private:
  std::string_view inner_;
  size_t prev_pos_ = 0;
  size_t pos_ = 0;
  size_t width_ = 0;
};
