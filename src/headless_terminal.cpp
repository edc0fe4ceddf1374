#include "headless_terminal.hpp"

bool HeadlessTerminal::write(const std::string& text) {
  if (fail_) return false;
  pending_ += text;
  return true;
}

bool HeadlessTerminal::flush() {
  if (fail_) { pending_.clear(); return false; }
  out_ += pending_;
  pending_.clear();
  return true;
}
