#pragma once
/*
 * TtyTerminal
 *
 * Purpose: ITerminal implementation writing escape sequences to a file descriptor.
 * Note: output is buffered until flush(); raw mode is managed by the Terminal guard.
 */
#include "iterminal.hpp"

class TtyTerminal : public ITerminal {
public:
  // out_fd receives the output, size_fd is queried for the window size
  TtyTerminal(int out_fd, int size_fd, TermCaps caps);
  TermSize getSize() const override;
  bool write(const std::string& text) override;
  bool flush() override;
  const TermCaps& caps() const override { return caps_; }
private:
  int out_fd_;
  int size_fd_;
  TermCaps caps_;
  std::string pending_;
};
