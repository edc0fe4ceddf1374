#include "term_caps.hpp"
#include <curses.h>
#include <term.h>

static std::string expand(const std::string& tpl, int n) {
  const char* s = tiparm(tpl.c_str(), n);
  return s ? std::string(s) : std::string();
}

std::string TermCaps::up(int n) const {
  if (n <= 0) return cr_;
  if (!cuu_.empty()) return expand(cuu_, n) + cr_;
  return "\x1b[" + std::to_string(n) + "A\r";
}

std::string TermCaps::down(int n) const {
  if (n <= 0) return cr_;
  if (!cud_.empty()) return expand(cud_, n) + cr_;
  return "\x1b[" + std::to_string(n) + "B\r";
}

std::string TermCaps::column(int c) const {
  if (c < 0) c = 0;
  if (!hpa_.empty()) return expand(hpa_, c);
  return "\x1b[" + std::to_string(c + 1) + "G";
}

TermCaps TermCaps::ansi() {
  TermCaps c;
  c.clear_line = "\x1b[K";
  c.invert = "\x1b[7m";
  c.dim = "\x1b[2m";
  c.reset = "\x1b[m";
  c.alert = "\x07";
  return c;
}

// tigetstr returns (char*)-1 for a non-string cap and 0 for an absent one
static bool lookup(const char* cap, std::string& out) {
  char* s = tigetstr(const_cast<char*>(cap));
  if (s == nullptr || s == reinterpret_cast<char*>(-1)) return false;
  out = s;
  return true;
}

bool TermCaps::from_terminfo(int fd, TermCaps& out, std::string& msg) {
  int err = 0;
  if (setupterm(nullptr, fd, &err) != OK) {
    msg = err == 0 ? "terminfo entry not found for $TERM" : "terminfo database not found";
    return false;
  }
  TermCaps c = ansi();
  std::string s;
  if (lookup("el", s)) c.clear_line = s;
  if (lookup("rev", s)) c.invert = s;
  if (lookup("dim", s)) c.dim = s;
  if (lookup("sgr0", s)) c.reset = s;
  if (lookup("bel", s)) c.alert = s;
  if (lookup("cr", s)) c.cr_ = s;
  lookup("cuu", c.cuu_);
  lookup("cud", c.cud_);
  lookup("hpa", c.hpa_);
  out = std::move(c);
  return true;
}
