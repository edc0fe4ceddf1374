#pragma once
/*
 * Terminal
 *
 * Purpose: RAII guard that puts the controlling terminal into raw mode.
 * Usage: acquire() in App::run; destructor restores the saved attributes.
 * Note: clears ICANON/ECHO only; ISIG stays on so Ctrl-C still raises SIGINT.
 */
#include <memory>
#include <string>
#include <termios.h>

class Terminal {
public:
  static std::unique_ptr<Terminal> acquire(int fd, std::string& msg);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  Terminal(int fd, const termios& saved) : fd_(fd), saved_(saved) {}
  int fd_;
  termios saved_;
};
