#pragma once
/*
 * Pane
 *
 * Purpose: inline viewport over a LineBuffer; owns geometry, scroll position and
 *          display options, and redraws itself below the shell prompt.
 * Layout: `height` content rows followed by one status row. A redraw moves up by
 *         the rows flushed last time, sweeps them, then writes the new block.
 * Note: every scroll_* returns the distance actually moved; callers rely on it.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "iterminal.hpp"
#include "line_buffer.hpp"
#include "search.hpp"
#include "types.hpp"

class Pane {
public:
  static constexpr int kMarginRightWidth = 4;
  static constexpr int kMessageBarHeight = 1;

  explicit Pane(ITerminal& term);

  // Replace the buffer and reset the position to (0, 0).
  void load(std::shared_ptr<const LineBuffer> buf);

  bool refresh();
  bool quit();
  bool clear();

  // Clamp to [1, terminal rows - 1]; the returned height is the one applied.
  int set_height(int n);
  int increment_height(int n);
  int decrement_height(int n);
  int height() const { return height_; }
  TermSize pane_dimensions() const;
  Position position() const { return pos_; }

  int scroll_up(const ScrollStep& step);
  int scroll_down(const ScrollStep& step);
  int scroll_left(const ScrollStep& step);
  int scroll_right(const ScrollStep& step);

  Position goto_top_of_lines();
  Position goto_bottom_of_lines();
  Position goto_head_of_line();
  Position goto_tail_of_line();
  int goto_absolute_line(int n);
  int goto_absolute_horizontal_offset(int n);

  void show_line_number(bool b) { show_linenumber_ = b; }
  bool line_number_shown() const { return show_linenumber_; }
  void show_highlight(bool b) { show_highlight_ = b; }
  void set_wrap(bool b);
  bool wraps() const { return wrap_; }
  void set_tab_width(int w);
  void set_message(std::optional<std::string> msg) { message_ = std::move(msg); }
  const std::optional<std::string>& message() const { return message_; }
  void set_highlight_searcher(std::shared_ptr<const ISearcher> s);

  int limit_bottom_y() const;
  int limit_right_x(int next_x, int max_len) const;
  std::pair<int, int> range_of_visible_lines() const;
  // Terminal rows for buffer line i, with gutter, marks and highlight applied.
  std::vector<std::string> decorate(int i) const;

private:
  int line_number_width() const;
  int gutter_width() const;
  int text_area_width() const;
  int printable_width() const;
  int max_width_of_visible_lines() const;
  int wrapped_rows(const std::string& raw) const;
  std::string line_number(int i) const;
  std::string extend_mark() const;
  std::string highlight(std::string_view slice, std::pair<size_t, size_t> range,
                        const std::vector<Match>& matches) const;
  std::vector<Match> match_ranges(std::string_view expanded) const;
  std::vector<std::string> decorate_trim(int i) const;
  std::vector<std::string> decorate_wrap(int i) const;
  std::string sweep(int n) const;

  ITerminal& term_;
  std::shared_ptr<const LineBuffer> buf_;
  std::shared_ptr<const ISearcher> searcher_;
  int height_ = 1;
  int flushed_ = 0;
  Position pos_;
  bool show_linenumber_ = false;
  bool show_highlight_ = false;
  bool wrap_ = false;
  int tab_width_;
  std::optional<std::string> message_;
};
