#pragma once
#include <cerrno>
#include <cstddef>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }

  static UniqueFd open_path(const char* path, int flags) {
    int fd;
    do { fd = ::open(path, flags | O_CLOEXEC); } while (fd < 0 && errno == EINTR);
    return UniqueFd(fd);
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // read(2) that retries on EINTR
  ssize_t read_some(void* dst, size_t n) const {
    ssize_t r;
    do { r = ::read(fd_, dst, n); } while (r < 0 && errno == EINTR);
    return r;
  }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};
