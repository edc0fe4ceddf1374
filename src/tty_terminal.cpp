#include "tty_terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>

static constexpr TermSize kFallbackSize{24, 80};

TtyTerminal::TtyTerminal(int out_fd, int size_fd, TermCaps caps)
  : out_fd_(out_fd), size_fd_(size_fd), caps_(std::move(caps)) {}

TermSize TtyTerminal::getSize() const {
  struct winsize ws{};
  if (::ioctl(size_fd_, TIOCGWINSZ, &ws) != 0 || ws.ws_row == 0 || ws.ws_col == 0) {
    if (::ioctl(out_fd_, TIOCGWINSZ, &ws) != 0 || ws.ws_row == 0 || ws.ws_col == 0) return kFallbackSize;
  }
  return {ws.ws_row, ws.ws_col};
}

bool TtyTerminal::write(const std::string& text) {
  pending_ += text;
  return true;
}

bool TtyTerminal::flush() {
  size_t off = 0;
  while (off < pending_.size()) {
    ssize_t n = ::write(out_fd_, pending_.data() + off, pending_.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      spdlog::error("terminal write failed: {}", std::strerror(errno));
      pending_.clear();
      return false;
    }
    off += static_cast<size_t>(n);
  }
  pending_.clear();
  return true;
}
