#pragma once
#include <string>
#include <string_view>

// Replace tabs with spaces up to the next multiple of tab_width (display
// columns, not bytes). Non-printable chars are dropped. tab_width 0 drops tabs.
std::string expand_tab(std::string_view s, int tab_width);
