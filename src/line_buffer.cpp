#include "line_buffer.hpp"
#include <iterator>

void LineBuffer::append(std::vector<std::string>&& lines) {
  if (lines.empty()) return;
  if (lines_.empty()) { lines_ = std::move(lines); return; }
  lines_.reserve(lines_.size() + lines.size());
  lines_.insert(lines_.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end()));
  lines.clear();
}
