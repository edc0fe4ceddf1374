#include "tab.hpp"
#include "config.hpp"
#include "unicode_divide.hpp"

std::string expand_tab(std::string_view s, int tab_width) {
  if (tab_width < 0) tab_width = 0;
  if (tab_width > MPAGE_MAX_TAB_WIDTH) tab_width = MPAGE_MAX_TAB_WIDTH;
  std::string out;
  out.reserve(s.size());
  int col = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t start = i;
    char32_t cp = next_codepoint(s, i);
    if (cp == U'\t') {
      if (tab_width > 0) {
        int frac = tab_width - (col % tab_width);
        out.append(static_cast<size_t>(frac), ' ');
        col += frac;
      }
      continue;
    }
    int w = char_width(cp);
    if (w < 0) continue;
    out.append(s.substr(start, i - start));
    col += w;
  }
  return out;
}
