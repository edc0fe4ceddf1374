#pragma once
/*
 * TermCaps
 *
 * Purpose: escape sequences the pane emits, looked up in terminfo.
 * Fallback: ANSI/VT100 sequences when $TERM has no terminfo entry.
 * Note: up()/down() also return the cursor to column 0; column() is 0-based.
 */
#include <string>

struct TermCaps {
  std::string clear_line;
  std::string invert;
  std::string dim;
  std::string reset;
  std::string alert;

  std::string up(int n) const;
  std::string down(int n) const;
  std::string column(int c) const;

  static TermCaps ansi();
  // Requires a terminal on fd; returns false with msg when terminfo is unusable.
  static bool from_terminfo(int fd, TermCaps& out, std::string& msg);

private:
  // parameterized terminfo strings; empty means use ANSI
  std::string cuu_;
  std::string cud_;
  std::string hpa_;
  std::string cr_ = "\r";
};
