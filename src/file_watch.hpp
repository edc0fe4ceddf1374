#pragma once
/*
 * FileWatch
 *
 * Purpose: block until the data source changed or a timeout elapsed.
 * Backends: InotifyWatcher (files, Linux), StatWatcher (files, any POSIX),
 *           PollWatcher (pipes), TimeoutWatcher (nothing to watch).
 * Note: ChangedHangup means the source will not grow any more; stop watching.
 */
#include <memory>
#include <string>
#include <sys/types.h>
#include <time.h>
#include "posix_fd.hpp"

class ISourceReader;

enum class WatchResult { Timeout, Changed, ChangedHangup, Error };

class IFileWatch {
public:
  virtual ~IFileWatch() = default;
  virtual WatchResult watch(int timeout_ms, std::string& msg) = 0;
  virtual const char* name() const = 0;
};

class InotifyWatcher : public IFileWatch {
public:
  static std::unique_ptr<InotifyWatcher> create(const std::string& path, std::string& msg);
  WatchResult watch(int timeout_ms, std::string& msg) override;
  const char* name() const override { return "inotify"; }
private:
  explicit InotifyWatcher(UniqueFd fd) : fd_(std::move(fd)) {}
  UniqueFd fd_;
};

class StatWatcher : public IFileWatch {
public:
  static constexpr int kIntervalMs = 100;
  static std::unique_ptr<StatWatcher> create(const std::string& path, std::string& msg);
  WatchResult watch(int timeout_ms, std::string& msg) override;
  const char* name() const override { return "stat"; }
private:
  StatWatcher(std::string path, off_t size, const timespec& mtime)
    : path_(std::move(path)), size_(size), mtime_(mtime) {}
  std::string path_;
  off_t size_;
  timespec mtime_;
};

class PollWatcher : public IFileWatch {
public:
  static constexpr int kRearmMs = 50;
  explicit PollWatcher(int fd) : fd_(fd) {}
  WatchResult watch(int timeout_ms, std::string& msg) override;
  const char* name() const override { return "poll"; }
private:
  int fd_;
  bool rearm_ = false;
};

class TimeoutWatcher : public IFileWatch {
public:
  WatchResult watch(int timeout_ms, std::string& msg) override;
  const char* name() const override { return "timeout"; }
};

// Pick a backend for the opened source; path is ignored for pipes.
std::unique_ptr<IFileWatch> make_watcher(const ISourceReader& src, const std::string& path);
