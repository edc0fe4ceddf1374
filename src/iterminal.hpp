#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract output terminal for the pane (size, write, flush, caps).
 * Goal: decouple from concrete impls (tty/headless), enable testing.
 */
#include <string>
#include "term_caps.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual bool write(const std::string& text) = 0;
  virtual bool flush() = 0;
  virtual const TermCaps& caps() const = 0;
};
