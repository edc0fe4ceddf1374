#include "file_watch.hpp"
#include <sys/inotify.h>
#include <sys/stat.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"

std::unique_ptr<InotifyWatcher> InotifyWatcher::create(const std::string& path, std::string& msg) {
  UniqueFd fd(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd.valid()) { msg = std::string("inotify_init1: ") + std::strerror(errno); return nullptr; }
  if (::inotify_add_watch(fd.get(), path.c_str(), IN_MODIFY | IN_CLOSE_WRITE) < 0) {
    msg = std::string("inotify_add_watch: ") + std::strerror(errno);
    return nullptr;
  }
  return std::unique_ptr<InotifyWatcher>(new InotifyWatcher(std::move(fd)));
}

WatchResult InotifyWatcher::watch(int timeout_ms, std::string& msg) {
  struct pollfd pfd{fd_.get(), POLLIN, 0};
  int r = ::poll(&pfd, 1, timeout_ms);
  if (r < 0) {
    if (errno == EINTR) return WatchResult::Timeout;
    msg = std::string("poll: ") + std::strerror(errno);
    return WatchResult::Error;
  }
  if (r == 0) return WatchResult::Timeout;
  // drain the queued events; one notification covers them all
  alignas(struct inotify_event) char buf[4096];
  for (;;) {
    ssize_t n = fd_.read_some(buf, sizeof(buf));
    if (n > 0) continue;
    if (n < 0 && errno != EAGAIN) {
      msg = std::string("read inotify: ") + std::strerror(errno);
      return WatchResult::Error;
    }
    break;
  }
  return WatchResult::Changed;
}

std::unique_ptr<StatWatcher> StatWatcher::create(const std::string& path, std::string& msg) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { msg = path + ": " + std::strerror(errno); return nullptr; }
  return std::unique_ptr<StatWatcher>(new StatWatcher(path, st.st_size, st.st_mtim));
}

WatchResult StatWatcher::watch(int timeout_ms, std::string& msg) {
  using clock = std::chrono::steady_clock;
  auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    struct stat st{};
    if (::stat(path_.c_str(), &st) != 0) {
      msg = path_ + ": " + std::strerror(errno);
      return WatchResult::Error;
    }
    bool changed = st.st_size != size_ || st.st_mtim.tv_sec != mtime_.tv_sec || st.st_mtim.tv_nsec != mtime_.tv_nsec;
    if (changed) {
      size_ = st.st_size;
      mtime_ = st.st_mtim;
      return WatchResult::Changed;
    }
    auto now = clock::now();
    if (now >= deadline) return WatchResult::Timeout;
    auto step = std::min<clock::duration>(deadline - now, std::chrono::milliseconds(kIntervalMs));
    std::this_thread::sleep_for(step);
  }
}

WatchResult PollWatcher::watch(int timeout_ms, std::string& msg) {
  if (rearm_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kRearmMs));
    rearm_ = false;
  }
  struct pollfd pfd{fd_, POLLIN, 0};
  int r = ::poll(&pfd, 1, timeout_ms);
  if (r < 0) {
    if (errno == EINTR) return WatchResult::Timeout;
    msg = std::string("poll: ") + std::strerror(errno);
    return WatchResult::Error;
  }
  if (r == 0) return WatchResult::Timeout;
  if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return WatchResult::ChangedHangup;
  rearm_ = true;
  return WatchResult::Changed;
}

WatchResult TimeoutWatcher::watch(int timeout_ms, std::string&) {
  std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
  return WatchResult::Timeout;
}

std::unique_ptr<IFileWatch> make_watcher(const ISourceReader& src, const std::string& path) {
  std::unique_ptr<IFileWatch> w;
  std::string msg;
  if (src.is_pipe()) {
    w = std::make_unique<PollWatcher>(src.fd());
  } else if (auto in = InotifyWatcher::create(path, msg)) {
    w = std::move(in);
  } else {
    spdlog::warn("inotify unavailable ({}), falling back to stat polling", msg);
    if (auto sw = StatWatcher::create(path, msg)) w = std::move(sw);
    else {
      spdlog::warn("stat watcher unavailable ({}), source will not be watched", msg);
      w = std::make_unique<TimeoutWatcher>();
    }
  }
  spdlog::info("watching {} with {} backend", path, w->name());
  return w;
}
