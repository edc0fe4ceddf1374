#pragma once
/*
 * LineBuffer
 *
 * Purpose: append-only ordered lines shared by App (writer) and Pane (reader).
 * Note: single writer; App appends between dispatch steps, never during a redraw,
 *       so no locking. Indices stay valid once assigned.
 */
#include <string>
#include <vector>

class LineBuffer {
public:
  LineBuffer() = default;
  explicit LineBuffer(std::vector<std::string> lines) : lines_(std::move(lines)) {}

  bool empty() const { return lines_.empty(); }
  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const { return lines_[static_cast<size_t>(r)]; }

  void append(std::vector<std::string>&& lines);
  void append_line(std::string s) { lines_.push_back(std::move(s)); }

private:
  std::vector<std::string> lines_;
};
