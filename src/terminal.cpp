#include "terminal.hpp"
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>

std::unique_ptr<Terminal> Terminal::acquire(int fd, std::string& msg) {
  termios saved{};
  if (::tcgetattr(fd, &saved) != 0) { msg = std::string("tcgetattr: ") + std::strerror(errno); return nullptr; }
  termios raw = saved;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(fd, TCSAFLUSH, &raw) != 0) { msg = std::string("tcsetattr: ") + std::strerror(errno); return nullptr; }
  return std::unique_ptr<Terminal>(new Terminal(fd, saved));
}

Terminal::~Terminal() {
  if (::tcsetattr(fd_, TCSAFLUSH, &saved_) != 0) {
    spdlog::error("failed to restore terminal mode: {}", std::strerror(errno));
  }
}
