#pragma once
/*
 * FileReader
 *
 * Purpose: read the data source incrementally and split it into lines; normalize CRLF.
 * Sources: FileSource (regular file, remembers a byte offset, reads via mmap)
 *          PipeSource (stdin/FIFO, keeps a partial-line carry-over until EOF).
 * Usage: read_incremental(out, timeout_ms, msg) appends only the new lines;
 *        returns false with msg on failure.
 */
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>
#include "posix_fd.hpp"

// Split data[0..n) at '\n' (dropping a '\r' before it) and append to out.
// A trailing segment without newline is appended too when non-empty.
void split_lines(const char* data, size_t n, std::vector<std::string>& out);

class ISourceReader {
public:
  virtual ~ISourceReader() = default;
  virtual bool read_incremental(std::vector<std::string>& out_lines, int timeout_ms, std::string& msg) = 0;
  virtual bool is_pipe() const = 0;
  virtual bool eof() const = 0;
  virtual int fd() const = 0;
};

class FileSource : public ISourceReader {
public:
  explicit FileSource(UniqueFd fd) : fd_(std::move(fd)) {}
  bool read_incremental(std::vector<std::string>& out_lines, int timeout_ms, std::string& msg) override;
  bool is_pipe() const override { return false; }
  bool eof() const override { return false; }
  int fd() const override { return fd_.get(); }
  off_t offset() const { return offset_; }
private:
  UniqueFd fd_;
  off_t offset_ = 0;
};

class PipeSource : public ISourceReader {
public:
  explicit PipeSource(UniqueFd fd) : fd_(std::move(fd)) {}
  bool read_incremental(std::vector<std::string>& out_lines, int timeout_ms, std::string& msg) override;
  bool is_pipe() const override { return true; }
  bool eof() const override { return eof_; }
  int fd() const override { return fd_.get(); }
  const std::string& carry() const { return carry_; }
private:
  void consume(const char* data, size_t n, std::vector<std::string>& out_lines);
  UniqueFd fd_;
  std::string carry_;
  bool eof_ = false;
};

// "-" selects standard input, which must not be an interactive terminal.
std::unique_ptr<ISourceReader> open_source(const std::string& path, std::string& msg);
