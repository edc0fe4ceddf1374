#include "pane.hpp"
#include <algorithm>
#include "config.hpp"
#include "tab.hpp"
#include "unicode_divide.hpp"

Pane::Pane(ITerminal& term)
  : term_(term),
    buf_(std::make_shared<LineBuffer>()),
    searcher_(std::make_shared<NullSearcher>()),
    tab_width_(MPAGE_DEFAULT_TAB_WIDTH) {}

void Pane::load(std::shared_ptr<const LineBuffer> buf) {
  buf_ = buf ? std::move(buf) : std::make_shared<LineBuffer>();
  pos_ = {0, 0};
}

void Pane::set_wrap(bool b) {
  wrap_ = b;
  if (wrap_) pos_.x = 0;
}

void Pane::set_tab_width(int w) {
  tab_width_ = std::clamp(w, 0, MPAGE_MAX_TAB_WIDTH);
}

void Pane::set_highlight_searcher(std::shared_ptr<const ISearcher> s) {
  if (!s) s = std::make_shared<NullSearcher>();
  searcher_ = std::move(s);
}

// ---- geometry ----

int Pane::set_height(int n) {
  int max = std::max(1, term_.getSize().rows - kMessageBarHeight);
  height_ = std::clamp(n, 1, max);
  return height_;
}

int Pane::increment_height(int n) {
  long long h = static_cast<long long>(height_) + std::max(0, n);
  return set_height(h > 0x3fffffff ? 0x3fffffff : static_cast<int>(h));
}

int Pane::decrement_height(int n) {
  return set_height(height_ > n ? height_ - n : 1);
}

TermSize Pane::pane_dimensions() const {
  TermSize ts = term_.getSize();
  return {std::min(height_, std::max(1, ts.rows - kMessageBarHeight)), ts.cols};
}

int Pane::line_number_width() const {
  int n = buf_->line_count();
  int digits = 1;
  while (n >= 10) { n /= 10; digits++; }
  return std::max(2, digits);
}

int Pane::gutter_width() const {
  return show_linenumber_ ? line_number_width() : 0;
}

int Pane::text_area_width() const {
  int width = pane_dimensions().cols;
  int marks = wrap_ ? 1 : 2;
  int g = gutter_width();
  return width > g + marks ? width - g - marks : 0;
}

int Pane::printable_width() const {
  return std::max(0, pane_dimensions().cols - gutter_width());
}

std::pair<int, int> Pane::range_of_visible_lines() const {
  int len = buf_->line_count();
  int y = std::min(pos_.y, len);
  return {y, std::min(len, y + pane_dimensions().rows)};
}

int Pane::max_width_of_visible_lines() const {
  auto [s, e] = range_of_visible_lines();
  int w = 0;
  for (int i = s; i < e; ++i) {
    w = std::max(w, display_width(expand_tab(buf_->line(i), tab_width_)));
  }
  return w;
}

int Pane::wrapped_rows(const std::string& raw) const {
  std::string expanded = expand_tab(raw, tab_width_);
  UnicodeStrDivider div(expanded, static_cast<size_t>(text_area_width()));
  std::string_view slice;
  int rows = 0;
  while (div.next(slice)) rows++;
  return std::max(1, rows);
}

int Pane::limit_bottom_y() const {
  int len = buf_->line_count();
  int h = pane_dimensions().rows;
  if (!wrap_) return len > h ? len - h : 0;

  // sum physical rows from the end until they fill the pane
  int sum = 0;
  for (int i = len - 1; i >= 0; --i) {
    sum += wrapped_rows(buf_->line(i));
    if (sum == h) return i;
    if (sum > h) return std::min(i + 1, len - 1);
  }
  return 0;
}

int Pane::limit_right_x(int next_x, int max_len) const {
  int margined = max_len + kMarginRightWidth;
  int pw = printable_width();
  if (pw >= margined) return 0;
  if (next_x + pw <= margined) return std::max(0, next_x);
  return margined - pw;
}

// ---- motion ----

int Pane::scroll_up(const ScrollStep& step) {
  int s = step.to_chars(pane_dimensions().rows);
  int a = std::min(pos_.y, s);
  pos_.y -= a;
  return a;
}

int Pane::scroll_down(const ScrollStep& step) {
  int s = step.to_chars(pane_dimensions().rows);
  int end = limit_bottom_y();
  int a = 0;
  if (end - pos_.y > s) a = s;
  else if (end > pos_.y) a = end - pos_.y;
  pos_.y += a;
  return a;
}

int Pane::scroll_left(const ScrollStep& step) {
  if (wrap_) return 0;
  int s = step.to_chars(printable_width());
  int a = std::min(pos_.x, s);
  pos_.x -= a;
  return a;
}

int Pane::scroll_right(const ScrollStep& step) {
  if (wrap_) return 0;
  int s = step.to_chars(printable_width());
  long long next = static_cast<long long>(pos_.x) + s;
  int x = limit_right_x(next > 0x3fffffff ? 0x3fffffff : static_cast<int>(next), max_width_of_visible_lines());
  if (x <= pos_.x) return 0;
  int a = x - pos_.x;
  pos_.x = x;
  return a;
}

Position Pane::goto_top_of_lines() {
  pos_ = {0, 0};
  return pos_;
}

Position Pane::goto_bottom_of_lines() {
  pos_ = {0, limit_bottom_y()};
  return pos_;
}

Position Pane::goto_head_of_line() {
  if (!wrap_) pos_.x = 0;
  return pos_;
}

Position Pane::goto_tail_of_line() {
  if (!wrap_) {
    int w = max_width_of_visible_lines();
    pos_.x = limit_right_x(w, w);
  }
  return pos_;
}

int Pane::goto_absolute_line(int n) {
  int len = buf_->line_count();
  if (len == 0 || n < 0) pos_.y = 0;
  else pos_.y = std::min(n, len - 1);
  return pos_.y;
}

int Pane::goto_absolute_horizontal_offset(int n) {
  if (!wrap_) pos_.x = limit_right_x(std::max(0, n), max_width_of_visible_lines());
  return pos_.x;
}

// ---- decoration ----

std::string Pane::line_number(int i) const {
  std::string num = std::to_string(i + 1);
  int w = line_number_width();
  if (static_cast<int>(num.size()) < w) num.insert(0, static_cast<size_t>(w) - num.size(), ' ');
  return num;
}

std::string Pane::extend_mark() const {
  const TermCaps& c = term_.caps();
  return c.dim + "+" + c.reset;
}

std::vector<Match> Pane::match_ranges(std::string_view expanded) const {
  if (searcher_->pattern().empty()) return {};
  return searcher_->find_all(expanded);
}

// Invert the parts of `slice` covered by matches. `range` is the slice's byte
// range inside the expanded line the matches were computed on.
std::string Pane::highlight(std::string_view slice, std::pair<size_t, size_t> range,
                            const std::vector<Match>& matches) const {
  const TermCaps& c = term_.caps();
  const size_t s0 = range.first;
  const size_t s1 = range.second;
  std::string out;
  size_t copied = 0;
  for (const Match& m : matches) {
    if (m.end <= m.start) continue;
    //  _  [    ]
    if (m.end <= s0) continue;
    //     [    ]  _
    if (m.start >= s1) break;
    // _[_  ]   [_ _]   [  _]_   _[____]_
    size_t a = std::max(m.start, s0) - s0;
    size_t b = std::min(m.end, s1) - s0;
    if (a < copied) continue;
    out.append(slice.substr(copied, a - copied));
    out += c.invert;
    out.append(slice.substr(a, b - a));
    out += c.reset;
    copied = b;
  }
  if (copied < slice.size()) out.append(slice.substr(copied));
  return out;
}

std::vector<std::string> Pane::decorate_trim(int i) const {
  std::string expanded = expand_tab(buf_->line(i), tab_width_);
  UnicodeStrDivider div(expanded, static_cast<size_t>(text_area_width()));
  div.seek_start(static_cast<size_t>(pos_.x));
  std::string_view slice;
  if (!div.next(slice)) slice = std::string_view();
  auto range = div.last_range();

  std::string row;
  if (show_linenumber_) row += line_number(i);
  row += range.first > 0 ? extend_mark() : std::string(" ");
  if (show_highlight_) row += highlight(slice, range, match_ranges(expanded));
  else row.append(slice);
  if (expanded.size() > range.second) {
    row += term_.caps().column(pane_dimensions().cols - 1);
    row += extend_mark();
  } else {
    row += term_.caps().reset;
  }
  return {row};
}

std::vector<std::string> Pane::decorate_wrap(int i) const {
  std::string expanded = expand_tab(buf_->line(i), tab_width_);
  UnicodeStrDivider div(expanded, static_cast<size_t>(text_area_width()));
  std::vector<Match> matches;
  if (show_highlight_) matches = match_ranges(expanded);
  std::string blank(static_cast<size_t>(gutter_width()), ' ');

  std::vector<std::string> rows;
  std::string_view slice;
  while (div.next(slice)) {
    bool first = rows.empty();
    std::string row;
    if (show_linenumber_) row += first ? line_number(i) : blank;
    row += first ? std::string(" ") : extend_mark();
    if (show_highlight_) row += highlight(slice, div.last_range(), matches);
    else row.append(slice);
    rows.push_back(std::move(row));
  }
  if (rows.empty()) rows.push_back(show_linenumber_ ? line_number(i) : std::string());
  return rows;
}

std::vector<std::string> Pane::decorate(int i) const {
  return wrap_ ? decorate_wrap(i) : decorate_trim(i);
}

// ---- output ----

std::string Pane::sweep(int n) const {
  const TermCaps& c = term_.caps();
  std::string s = c.column(0);
  for (int k = 0; k < n; ++k) { s += c.clear_line; s += "\n"; }
  s += c.clear_line;
  if (n > 0) s += c.up(n);
  return s;
}

bool Pane::refresh() {
  const TermCaps& c = term_.caps();
  TermSize dim = pane_dimensions();
  int h = dim.rows;

  std::string block;
  int n = 0;
  auto [s, e] = range_of_visible_lines();
  for (int i = s; i < e && n < h; ++i) {
    for (auto& row : decorate(i)) {
      block += row;
      block += "\n";
      if (++n >= h) break;
    }
  }
  if (h > n) block += c.down(h - n);

  if (message_) {
    size_t cut = index_of_width(*message_, static_cast<size_t>(std::max(0, dim.cols - 1)));
    block.append(*message_, 0, cut);
  } else if (pos_.y >= limit_bottom_y()) {
    block += c.invert + "(END)" + c.reset;
  }

  std::string out;
  if (flushed_ > 0) out += c.up(flushed_);
  out += sweep(std::max(flushed_, h));
  out += block;
  if (!term_.write(out) || !term_.flush()) return false;
  flushed_ = h;
  return true;
}

bool Pane::quit() {
  const TermCaps& c = term_.caps();
  return term_.write(c.column(0) + c.clear_line) && term_.flush();
}

bool Pane::clear() {
  std::string out;
  if (flushed_ > 0) out += term_.caps().up(flushed_);
  out += sweep(flushed_);
  if (!term_.write(out) || !term_.flush()) return false;
  flushed_ = 0;
  return true;
}
