#include "options.hpp"
#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cstdlib>

static bool parse_number(const char* s, int lo, int hi, int& out) {
  if (s == nullptr || *s == '\0') return false;
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || *end != '\0' || v < lo || v > hi) return false;
  out = static_cast<int>(v);
  return true;
}

bool parse_options(int argc, char** argv, Options& out, std::string& msg) {
  static const struct option long_opts[] = {
    {"lines", required_argument, nullptr, 'n'},
    {"print-number", no_argument, nullptr, 'N'},
    {"wrap", no_argument, nullptr, 'w'},
    {"tab-width", required_argument, nullptr, 't'},
    {"follow", no_argument, nullptr, 'f'},
    {"fixed-strings", no_argument, nullptr, 'F'},
    {"log", required_argument, nullptr, 'l'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
  };
  if (const char* env = std::getenv("MPAGE_LOG")) out.log_path = env;
  optind = 0; // glibc: full rescan, parse_options may run more than once
  opterr = 0;
  int c;
  while ((c = getopt_long(argc, argv, ":n:Nwt:fFl:h", long_opts, nullptr)) != -1) {
    switch (c) {
      case 'n':
        if (!parse_number(optarg, 0, INT_MAX, out.lines)) { msg = std::string("invalid number of lines: ") + optarg; return false; }
        break;
      case 'N': out.print_number = true; break;
      case 'w': out.wrap = true; break;
      case 't':
        if (!parse_number(optarg, 0, MPAGE_MAX_TAB_WIDTH, out.tab_width)) { msg = std::string("invalid tab width: ") + optarg; return false; }
        break;
      case 'f': out.follow = true; break;
      case 'F': out.fixed_strings = true; break;
      case 'l': out.log_path = optarg; break;
      case 'h': out.help = true; break;
      case ':':
        msg = std::string("option requires an argument: ") + argv[optind - 1];
        return false;
      default:
        if (optopt != 0) msg = std::string("unknown option: -") + static_cast<char>(optopt);
        else msg = std::string("unknown option: ") + argv[optind - 1];
        return false;
    }
  }
  if (optind < argc) out.file = argv[optind++];
  if (optind < argc) { msg = std::string("unexpected argument: ") + argv[optind]; return false; }
  return true;
}

std::string usage(const char* prog) {
  std::string s = "usage: ";
  s += prog;
  s += " [options] [FILE]\n"
       "\n"
       "Page through FILE (or standard input when FILE is - or missing) inline,\n"
       "below the shell prompt.\n"
       "\n"
       "  -n, --lines NUMBER      pane height (default " + std::to_string(MPAGE_DEFAULT_LINES) + ")\n"
       "  -N, --print-number      show line numbers\n"
       "  -w, --wrap              wrap long lines\n"
       "  -t, --tab-width NUMBER  tab width 0.." + std::to_string(MPAGE_MAX_TAB_WIDTH) +
       " (default " + std::to_string(MPAGE_DEFAULT_TAB_WIDTH) + ")\n"
       "  -f, --follow            start in follow mode\n"
       "  -F, --fixed-strings     search literal text instead of regular expressions\n"
       "  -l, --log FILE          write a diagnostic log to FILE (also $MPAGE_LOG)\n"
       "  -h, --help              show this help\n";
  return s;
}
