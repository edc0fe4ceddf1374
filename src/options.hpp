#pragma once
/*
 * Options
 *
 * Purpose: command line of the pager, parsed with getopt_long.
 * Errors: parse_options() returns false with msg (bad number, unknown flag).
 */
#include <string>
#include "config.hpp"

struct Options {
  int lines = MPAGE_DEFAULT_LINES;
  int tab_width = MPAGE_DEFAULT_TAB_WIDTH;
  bool print_number = false;
  bool wrap = false;
  bool follow = false;
  bool fixed_strings = false;
  bool help = false;
  std::string log_path;
  std::string file = MPAGE_STDIN_PLACEHOLDER;
};

bool parse_options(int argc, char** argv, Options& out, std::string& msg);
std::string usage(const char* prog);
