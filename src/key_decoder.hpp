#pragma once
/*
 * KeyDecoder
 *
 * Purpose: turn raw terminal bytes into Keys (UTF-8 chars, Ctrl+letter,
 *          Enter/Backspace/Delete, arrows, Home/End, PageUp/PageDown, Escape).
 * Note: after ESC waits esc_delay_ms for a follow-up byte; none means a lone Escape.
 */
#include <string>
#include "config.hpp"

enum class KeyType {
  Char, Ctrl, Esc, Enter, Backspace, Delete,
  Up, Down, Left, Right, Home, End, PageUp, PageDown,
  Unknown
};

struct Key {
  KeyType type = KeyType::Unknown;
  char32_t ch = 0; // code point for Char, lowercase letter for Ctrl

  static Key character(char32_t c) { return {KeyType::Char, c}; }
  static Key ctrl(char c) { return {KeyType::Ctrl, static_cast<char32_t>(c)}; }
  static Key of(KeyType t) { return {t, 0}; }
  bool operator==(const Key& o) const { return type == o.type && ch == o.ch; }

  // Binding-table spelling: "j", "^D", "<Up>", ...
  std::string token() const;
};

class KeyDecoder {
public:
  explicit KeyDecoder(int fd, int esc_delay_ms = MPAGE_ESC_DELAY_MS) : fd_(fd), esc_delay_ms_(esc_delay_ms) {}
  // Blocks until a key is available; false with msg on EOF or read error.
  bool next(Key& out, std::string& msg);
private:
  // 1: byte read, 0: timed out, -1: EOF/error (msg set)
  int read_byte(unsigned char& b, int timeout_ms, std::string& msg);
  Key decode_escape(std::string& msg, bool& failed);
  int fd_;
  int esc_delay_ms_;
  std::string pending_;
};
