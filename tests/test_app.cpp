#include "app.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <chrono>
#include <clocale>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <pty.h>
#include <termios.h>
#include <unistd.h>

// Source fed by the test: each read returns the next queued batch.
class MemorySource : public ISourceReader {
public:
  explicit MemorySource(std::deque<std::vector<std::string>>* batches, bool* fail)
    : batches_(batches), fail_(fail) {}
  bool read_incremental(std::vector<std::string>& out, int, std::string& msg) override {
    if (*fail_) { msg = "read error"; return false; }
    if (batches_->empty()) return true;
    out = std::move(batches_->front());
    batches_->pop_front();
    return true;
  }
  bool is_pipe() const override { return true; }
  bool eof() const override { return false; }
  int fd() const override { return -1; }
private:
  std::deque<std::vector<std::string>>* batches_;
  bool* fail_;
};

struct Fixture {
  HeadlessTerminal term{24, 40};
  std::deque<std::vector<std::string>> batches;
  bool fail = false;
  std::shared_ptr<LineBuffer> buf = std::make_shared<LineBuffer>();
  std::unique_ptr<App> app;

  explicit Fixture(int n, Options opts = Options()) {
    std::vector<std::string> first;
    for (int i = 0; i < n; ++i) first.push_back("line " + std::to_string(i));
    batches.push_back(std::move(first));
    app = std::make_unique<App>(term, buf, std::make_unique<MemorySource>(&batches, &fail),
                                make_searcher(false), opts);
    std::string msg;
    assert(app->load(msg));
    assert(app->begin());
  }
  bool run(const Command& c) { return app->handle(c); }
  Position pos() const { return app->pane().position(); }
};

static Command cmd(CommandKind k, int n = 0) { return Command::of(k, n); }

static void test_motion() {
  Fixture f(30);
  assert(f.buf->line_count() == 30);
  assert(f.app->pane().height() == 5);
  assert(f.run(cmd(CommandKind::MoveDown, 3)));
  assert(f.pos().y == 3);
  assert(f.run(cmd(CommandKind::MoveUp, 1)));
  assert(f.pos().y == 2);
  assert(f.run(cmd(CommandKind::MoveDownPages, 1)));
  assert(f.pos().y == 7);
  assert(f.run(cmd(CommandKind::MoveToBottomOfLines)));
  assert(f.pos().y == 25);
  assert(f.run(cmd(CommandKind::MoveToTopOfLines)));
  assert(f.pos().y == 0);
  assert(f.run(cmd(CommandKind::MoveToLineNumber, 9)));
  assert(f.pos().y == 9);
  assert(f.run(cmd(CommandKind::MoveUpHalfPages, 2)));
  assert(f.pos().y == 4);

  assert(f.run(cmd(CommandKind::SetNumOfLines, 8)));
  assert(f.app->pane().height() == 8);
  assert(f.run(cmd(CommandKind::IncrementLines, 2)));
  assert(f.app->pane().height() == 10);
  assert(f.run(cmd(CommandKind::DecrementLines, 100)));
  assert(f.app->pane().height() == 1);

  assert(f.run(cmd(CommandKind::ToggleLineNumberPrinting)));
  assert(f.app->pane().line_number_shown());
  assert(f.run(cmd(CommandKind::ToggleLineWraps)));
  assert(f.app->pane().wraps());
  assert(!f.app->should_quit());
}

static void test_search() {
  Fixture f(30);
  assert(f.run(Command::search_incremental("")));
  assert(f.app->pane().message() == std::string("/"));
  assert(f.pos().y == 0);
  assert(f.run(Command::search_incremental("line 2")));
  assert(f.app->pane().message() == std::string("/line 2"));
  assert(f.pos().y == 2);
  assert(f.run(cmd(CommandKind::SearchTrigger)));
  assert(!f.app->pane().message());

  assert(f.run(cmd(CommandKind::SearchNext)));
  assert(f.pos().y == 20);
  assert(f.run(cmd(CommandKind::SearchPrev)));
  assert(f.pos().y == 2);
  // no wrap-around past the start
  assert(f.run(cmd(CommandKind::SearchPrev)));
  assert(f.pos().y == 2);

  // rejected pattern: old pattern and position stay
  assert(f.run(Command::search_incremental("line (")));
  assert(f.app->pane().message() == std::string("/line (  [invalid pattern]"));
  assert(f.app->searcher().pattern() == "line 2");
  assert(f.pos().y == 2);

  assert(f.run(cmd(CommandKind::Cancel)));
  assert(f.app->searcher().pattern().empty());
  assert(!f.app->pane().message());

  assert(f.run(Command::message(std::string("note"))));
  assert(f.app->pane().message() == std::string("note"));
  assert(f.run(Command::message(std::nullopt)));
  assert(!f.app->pane().message());

  // search output is highlighted
  f.term.clear_output();
  assert(f.run(Command::search_incremental("line 29")));
  assert(f.pos().y == 29);
  assert(f.term.output().find("\x1b[7mline 29\x1b[m") != std::string::npos);
}

static void test_interrupt_and_updates() {
  Fixture f(3);
  f.term.clear_output();
  assert(f.run(cmd(CommandKind::Interrupt)));
  assert(f.term.output().find('\x07') != std::string::npos);
  assert(!f.app->pane().message());

  f.batches.push_back({"more"});
  assert(f.run(cmd(CommandKind::FileUpdated)));
  assert(f.buf->line_count() == 4);
  assert(f.pos().y == 0);

  // reload failure leaves the buffer alone
  f.fail = true;
  f.batches.push_back({"lost"});
  assert(f.run(cmd(CommandKind::FileUpdated)));
  assert(f.buf->line_count() == 4);
  f.fail = false;

  f.term.set_size(4, 40);
  assert(f.run(cmd(CommandKind::Resize)));
  assert(f.app->pane().height() == 3);
}

static void test_follow() {
  Fixture f(30);
  f.batches.push_back({"new 1", "new 2"});
  assert(f.run(cmd(CommandKind::FollowMode)));
  assert(f.app->mode() == Mode::Follow);
  assert(f.buf->line_count() == 32);
  assert(f.pos().y == 27);
  assert(f.app->pane().message() == std::string(App::kFollowBanner));

  // repositioning is ignored while following
  assert(f.run(cmd(CommandKind::MoveToTopOfLines)));
  assert(f.run(cmd(CommandKind::MoveUp, 5)));
  assert(f.pos().y == 27);

  f.batches.push_back({"new 3"});
  assert(f.run(cmd(CommandKind::FileUpdated)));
  assert(f.buf->line_count() == 33);
  assert(f.pos().y == 28);

  assert(f.run(cmd(CommandKind::SetNumOfLines, 3)));
  assert(f.app->pane().height() == 3);
  assert(f.pos().y == 30);

  // highlight-only search
  assert(f.run(Command::search_incremental("line 1")));
  assert(f.app->pane().message() == std::string("/line 1"));
  assert(f.pos().y == 30);
  assert(f.run(cmd(CommandKind::SearchTrigger)));
  assert(f.app->pane().message() == std::string(App::kFollowBanner));
  assert(f.app->searcher().pattern() == "line 1");
  assert(f.run(cmd(CommandKind::Cancel)));
  assert(f.app->searcher().pattern().empty());

  assert(f.run(cmd(CommandKind::Interrupt)));
  assert(f.app->mode() == Mode::Normal);
  assert(!f.app->pane().message());

  assert(f.run(cmd(CommandKind::FollowMode)));
  assert(f.run(cmd(CommandKind::FollowMode)));
  assert(f.app->mode() == Mode::Normal);

  Options opts;
  opts.follow = true;
  Fixture g(10, opts);
  assert(g.app->mode() == Mode::Follow);
  assert(g.pos().y == 5);
}

static void test_quit() {
  Fixture f(3);
  f.term.clear_output();
  assert(f.run(cmd(CommandKind::Quit)));
  assert(f.app->should_quit());
  assert(f.term.output() == "\x1b[1G\x1b[K");

  Fixture g(3);
  g.term.clear_output();
  assert(g.run(cmd(CommandKind::QuitWithClear)));
  assert(g.app->should_quit());
  const std::string& out = g.term.output();
  assert(out.find("\x1b[5A\r") == 0);
  assert(out.substr(out.size() - 7) == "\x1b[1G\x1b[K");

  // follow mode quits too
  Fixture h(3);
  assert(h.run(cmd(CommandKind::FollowMode)));
  assert(h.run(cmd(CommandKind::Quit)));
  assert(h.app->should_quit());

  Fixture broken(3);
  broken.term.fail_writes(true);
  assert(!broken.run(cmd(CommandKind::MoveDown, 1)));
}

static void test_search_long_line() {
  HeadlessTerminal term(24, 40);
  std::deque<std::vector<std::string>> batches;
  batches.push_back({"short", std::string(200000, 'a'), "tail ab"});
  bool fail = false;
  auto buf = std::make_shared<LineBuffer>();
  App app(term, buf, std::make_unique<MemorySource>(&batches, &fail), make_searcher(false), Options());
  std::string msg;
  assert(app.load(msg));
  assert(app.begin());
  assert(app.handle(Command::search_incremental("a*b")));
  assert(app.pane().position().y == 2);
  assert(app.handle(Command::of(CommandKind::SearchNext)));
  assert(app.pane().position().y == 2);
  assert(app.handle(Command::search_incremental("(a|b)*c")));
  assert(app.handle(Command::of(CommandKind::MoveToTopOfLines)));
  assert(app.handle(Command::of(CommandKind::ToggleLineWraps)));
  assert(app.pane().message() == std::string("/(a|b)*c"));
}

static void write_all(int fd, const std::string& s) {
  assert(::write(fd, s.data(), s.size()) == static_cast<ssize_t>(s.size()));
}

static void pause_ms(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Full session: keys from a pty, new data from a pipe, quit with 'q'.
static void test_run_session() {
  int master = -1;
  int slave = -1;
  assert(::openpty(&master, &slave, nullptr, nullptr, nullptr) == 0);
  termios before{};
  assert(::tcgetattr(slave, &before) == 0);
  assert(before.c_lflag & ICANON);

  int p[2];
  assert(::pipe(p) == 0);
  std::string initial;
  for (int i = 0; i < 10; ++i) initial += "row " + std::to_string(i) + "\n";
  write_all(p[1], initial);

  HeadlessTerminal term(24, 40);
  auto buf = std::make_shared<LineBuffer>();
  App app(term, buf, std::make_unique<PipeSource>(UniqueFd(p[0])), make_searcher(false), Options());
  std::string msg;
  assert(app.load(msg));
  assert(buf->line_count() == 10);

  int code = -1;
  std::string run_msg;
  std::thread session([&] {
    code = app.run(slave, std::make_unique<PollWatcher>(p[0]), run_msg);
  });

  pause_ms(200);
  termios raw{};
  assert(::tcgetattr(slave, &raw) == 0);
  assert(!(raw.c_lflag & ICANON) && !(raw.c_lflag & ECHO));

  write_all(p[1], "appended row\n");
  pause_ms(300);
  write_all(master, "2j");
  pause_ms(200);
  write_all(master, "q");
  session.join();

  assert(code == 0);
  assert(run_msg.empty());
  assert(app.should_quit());
  assert(buf->line_count() == 11);
  assert(buf->line(10) == "appended row");
  assert(app.pane().position().y == 2);
  // the redraw after the key presses shows the rows below the new top line
  assert(term.output().find(" row 6") != std::string::npos);
  assert(term.output().size() >= 7);
  assert(term.output().substr(term.output().size() - 7) == "\x1b[1G\x1b[K");

  termios after{};
  assert(::tcgetattr(slave, &after) == 0);
  assert(after.c_lflag == before.c_lflag);
  assert(after.c_cc[VMIN] == before.c_cc[VMIN]);

  ::close(p[1]);
  ::close(master);
  ::close(slave);
}

int main() {
  std::setlocale(LC_CTYPE, "C.UTF-8");
  test_motion();
  test_search();
  test_interrupt_and_updates();
  test_follow();
  test_quit();
  test_search_long_line();
  test_run_session();
  return 0;
}
