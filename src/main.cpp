#include <clocale>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <langinfo.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "app.hpp"
#include "file_reader.hpp"
#include "file_watch.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "posix_fd.hpp"
#include "search.hpp"
#include "tty_terminal.hpp"

// Display widths need a UTF-8 LC_CTYPE; returns the codeset in effect.
static std::string use_utf8_ctype() {
  std::setlocale(LC_ALL, "");
  if (std::strcmp(nl_langinfo(CODESET), "UTF-8") != 0) std::setlocale(LC_CTYPE, "C.UTF-8");
  return nl_langinfo(CODESET);
}

static int fail(const std::string& msg) {
  std::fprintf(stderr, "mpage: %s\n", msg.c_str());
  spdlog::error("startup failed: {}", msg);
  shutdown_logging();
  return 1;
}

int main(int argc, char** argv) {
  const std::string codeset = use_utf8_ctype();

  Options opts;
  std::string msg;
  if (!parse_options(argc, argv, opts, msg)) {
    std::fprintf(stderr, "mpage: %s\n%s", msg.c_str(), usage(argv[0]).c_str());
    return 1;
  }
  if (opts.help) {
    std::fputs(usage(argv[0]).c_str(), stdout);
    return 0;
  }
  if (!init_logging(opts.log_path, "", msg)) {
    std::fprintf(stderr, "mpage: %s\n", msg.c_str());
    return 1;
  }
  spdlog::info("start file={} lines={} tab={} number={} wrap={} follow={} fixed={}",
               opts.file, opts.lines, opts.tab_width, opts.print_number, opts.wrap,
               opts.follow, opts.fixed_strings);
  if (codeset != "UTF-8") spdlog::warn("no UTF-8 locale (codeset {}), non-ASCII widths are approximate", codeset);

  auto src = open_source(opts.file, msg);
  if (!src) return fail(msg);
  // keys come from the controlling terminal, so piped input keeps working
  UniqueFd tty = UniqueFd::open_path("/dev/tty", O_RDWR);
  if (!tty.valid()) return fail("can not open /dev/tty");

  TermCaps caps;
  if (!TermCaps::from_terminfo(STDOUT_FILENO, caps, msg)) {
    spdlog::warn("{}, using ANSI sequences", msg);
    caps = TermCaps::ansi();
  }
  TtyTerminal term(STDOUT_FILENO, tty.get(), std::move(caps));

  auto watcher = make_watcher(*src, opts.file);
  auto buf = std::make_shared<LineBuffer>();
  App app(term, buf, std::move(src), make_searcher(opts.fixed_strings), opts);
  if (!app.load(msg)) return fail(msg);

  msg.clear();
  int code = app.run(tty.get(), std::move(watcher), msg);
  if (code != 0 && !msg.empty()) std::fprintf(stderr, "mpage: %s\n", msg.c_str());
  shutdown_logging();
  return code;
}
