#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records every flushed byte; size is fixed until set_size(); ANSI caps.
 */
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : size_{rows, cols}, caps_(TermCaps::ansi()) {}

  TermSize getSize() const override { return size_; }
  bool write(const std::string& text) override;
  bool flush() override;
  const TermCaps& caps() const override { return caps_; }

  void set_size(int rows, int cols) { size_ = {rows, cols}; }
  // make every following write/flush report failure
  void fail_writes(bool b) { fail_ = b; }
  const std::string& output() const { return out_; }
  void clear_output() { out_.clear(); }
private:
  TermSize size_;
  TermCaps caps_;
  std::string pending_;
  std::string out_;
  bool fail_ = false;
};
