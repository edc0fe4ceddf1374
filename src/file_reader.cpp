#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cstring>
#include <thread>
#include <future>
#include <algorithm>
#include <spdlog/spdlog.h>
#include "config.hpp"

static constexpr size_t kReadChunk = 64 * 1024;
static constexpr int kMaxChunksPerRead = 1024;

static void split_range(const char* data, size_t start, size_t n, std::vector<std::string>& out) {
  for (size_t i = start; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out.emplace_back(data + start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
  }
}

void split_lines(const char* data, size_t n, std::vector<std::string>& out) {
  if (n == 0) return;
  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  const size_t min_parallel_size = 1 << 20;
  if (n < min_parallel_size || hw == 1) {
    split_range(data, 0, n, out);
    return;
  }
  unsigned threads = std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size));
  threads = std::max(threads, 2u);
  std::vector<std::vector<size_t>> newline_pos(threads);
  std::vector<std::future<void>> futs;
  size_t chunk = n / threads;
  for (unsigned t = 0; t < threads; ++t) {
    size_t s = t * chunk;
    size_t e = (t + 1 == threads) ? n : (t + 1) * chunk;
    futs.emplace_back(std::async(std::launch::async, [&, s, e, t]{
      auto& vec = newline_pos[t];
      vec.reserve((e - s) / 64 + 1);
      for (size_t i = s; i < e; ++i) {
        if (data[i] == '\n') vec.push_back(i);
      }
    }));
  }
  for (auto& f : futs) f.get();
  size_t total_nl = 0; for (const auto& v : newline_pos) total_nl += v.size();
  out.reserve(out.size() + total_nl + 1);
  size_t start = 0;
  for (const auto& v : newline_pos) {
    for (size_t pos : v) {
      size_t end = pos;
      if (end > start && data[end - 1] == '\r') end--;
      out.emplace_back(data + start, end - start);
      start = pos + 1;
    }
  }
  if (start < n) split_range(data, start, n, out);
}

bool FileSource::read_incremental(std::vector<std::string>& out_lines, int, std::string& msg) {
  struct stat st{};
  if (::fstat(fd_.get(), &st) != 0) { msg = std::string("can not read file stat: ") + std::strerror(errno); return false; }
  if (st.st_size < offset_) {
    spdlog::warn("source shrank from {} to {} bytes, skipping to the new end",
                 static_cast<long long>(offset_), static_cast<long long>(st.st_size));
    offset_ = st.st_size;
    return true;
  }
  if (st.st_size == offset_) return true;
  size_t n = static_cast<size_t>(st.st_size);
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd_.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + std::strerror(errno); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  size_t off = static_cast<size_t>(offset_);
  split_lines(data + off, n - off, out_lines);
  ::munmap(mem, n);
  offset_ = st.st_size;
  return true;
}

void PipeSource::consume(const char* data, size_t n, std::vector<std::string>& out_lines) {
  carry_.append(data, n);
  size_t last_nl = carry_.rfind('\n');
  if (last_nl == std::string::npos) return;
  split_lines(carry_.data(), last_nl + 1, out_lines);
  carry_.erase(0, last_nl + 1);
}

bool PipeSource::read_incremental(std::vector<std::string>& out_lines, int timeout_ms, std::string& msg) {
  if (eof_) return true;
  char buf[kReadChunk];
  for (int chunks = 0; chunks < kMaxChunksPerRead; ++chunks) {
    struct pollfd pfd{fd_.get(), POLLIN, 0};
    int r = ::poll(&pfd, 1, timeout_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      msg = std::string("poll failed: ") + std::strerror(errno);
      return false;
    }
    if (r == 0) break;
    ssize_t got = fd_.read_some(buf, sizeof(buf));
    if (got < 0) {
      if (errno == EAGAIN) break;
      msg = std::string("read failed: ") + std::strerror(errno);
      return false;
    }
    if (got == 0) {
      eof_ = true;
      if (!carry_.empty()) {
        split_lines(carry_.data(), carry_.size(), out_lines);
        carry_.clear();
      }
      break;
    }
    consume(buf, static_cast<size_t>(got), out_lines);
  }
  return true;
}

std::unique_ptr<ISourceReader> open_source(const std::string& path, std::string& msg) {
  if (path == MPAGE_STDIN_PLACEHOLDER) {
    if (::isatty(STDIN_FILENO)) { msg = "no input: standard input is a terminal and no file was given"; return nullptr; }
    UniqueFd fd(::dup(STDIN_FILENO));
    if (!fd.valid()) { msg = std::string("can not read standard input: ") + std::strerror(errno); return nullptr; }
    return std::make_unique<PipeSource>(std::move(fd));
  }
  UniqueFd fd = UniqueFd::open_path(path.c_str(), O_RDONLY);
  if (!fd.valid()) { msg = path + ": " + std::strerror(errno); return nullptr; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = path + ": " + std::strerror(errno); return nullptr; }
  if (S_ISDIR(st.st_mode)) { msg = path + ": is a directory"; return nullptr; }
  if (!S_ISREG(st.st_mode)) return std::make_unique<PipeSource>(std::move(fd));
  return std::make_unique<FileSource>(std::move(fd));
}
