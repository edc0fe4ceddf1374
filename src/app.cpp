#include "app.hpp"
#include <pthread.h>
#include <signal.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "event_queue.hpp"
#include "key_decoder.hpp"
#include "keybind.hpp"
#include "terminal.hpp"

using CommandQueue = EventQueue<Command>;
using StopFlag = std::atomic<bool>;

App::App(ITerminal& term, std::shared_ptr<LineBuffer> buf, std::unique_ptr<ISourceReader> src,
         std::shared_ptr<ISearcher> searcher, const Options& opts)
  : term_(term),
    buf_(buf ? std::move(buf) : std::make_shared<LineBuffer>()),
    src_(std::move(src)),
    searcher_(searcher ? std::move(searcher) : std::make_shared<NullSearcher>()),
    pane_(term),
    start_in_follow_(opts.follow) {
  pane_.load(buf_);
  pane_.set_height(opts.lines);
  pane_.set_tab_width(opts.tab_width);
  pane_.show_line_number(opts.print_number);
  pane_.set_wrap(opts.wrap);
  pane_.show_highlight(true);
  pane_.set_highlight_searcher(searcher_);
}

bool App::load(std::string& msg) {
  if (!src_) return true;
  std::vector<std::string> lines;
  if (!src_->read_incremental(lines, MPAGE_PIPE_WAIT_MS, msg)) return false;
  spdlog::info("loaded {} lines", lines.size());
  buf_->append(std::move(lines));
  return true;
}

void App::reload() {
  if (!src_) return;
  std::vector<std::string> lines;
  std::string msg;
  if (!src_->read_incremental(lines, 0, msg)) {
    spdlog::warn("reload failed: {}", msg);
    return;
  }
  if (!lines.empty()) spdlog::debug("reload appended {} lines", lines.size());
  buf_->append(std::move(lines));
}

bool App::begin() {
  if (start_in_follow_) return handle(Command::of(CommandKind::FollowMode));
  return pane_.refresh();
}

bool App::handle(const Command& c) {
  spdlog::debug("dispatch {} in {} mode", to_string(c), mode_ == Mode::Normal ? "normal" : "follow");
  return mode_ == Mode::Normal ? handle_normal(c) : handle_follow(c);
}

bool App::update_search(const std::string& text) {
  std::string msg;
  if (!searcher_->set_pattern(text, msg)) {
    spdlog::info("rejected search pattern \"{}\": {}", text, msg);
    pane_.set_message("/" + text + "  [invalid pattern]");
    return false;
  }
  pane_.set_message("/" + text);
  return true;
}

void App::clear_search() {
  std::string msg;
  if (!searcher_->set_pattern("", msg)) spdlog::warn("can not clear search pattern: {}", msg);
}

void App::jump_to_match(int from, bool backward) {
  int len = buf_->line_count();
  if (len == 0 || searcher_->pattern().empty()) return;
  int step = backward ? -1 : 1;
  for (int i = from; i >= 0 && i < len; i += step) {
    if (searcher_->find_first(buf_->line(i))) {
      pane_.goto_absolute_line(i);
      return;
    }
  }
}

bool App::handle_quit(const Command& c) {
  should_quit_ = true;
  if (c.kind == CommandKind::QuitWithClear && !pane_.clear()) return false;
  return pane_.quit();
}

bool App::resize() {
  pane_.set_height(pane_.height());
  if (mode_ == Mode::Follow) pane_.goto_bottom_of_lines();
  return pane_.refresh();
}

void App::enter_follow() {
  reload();
  pane_.goto_bottom_of_lines();
  pane_.set_message(std::string(kFollowBanner));
  mode_ = Mode::Follow;
  spdlog::info("follow mode on");
}

void App::leave_follow() {
  pane_.set_message(std::nullopt);
  mode_ = Mode::Normal;
  spdlog::info("follow mode off");
}

bool App::handle_normal(const Command& c) {
  const int n = c.count;
  switch (c.kind) {
    case CommandKind::MoveDown: pane_.scroll_down(ScrollStep::chars(n)); break;
    case CommandKind::MoveUp: pane_.scroll_up(ScrollStep::chars(n)); break;
    case CommandKind::MoveLeft: pane_.scroll_left(ScrollStep::chars(n)); break;
    case CommandKind::MoveRight: pane_.scroll_right(ScrollStep::chars(n)); break;
    case CommandKind::MoveDownHalfPages: pane_.scroll_down(ScrollStep::half_pages(n)); break;
    case CommandKind::MoveUpHalfPages: pane_.scroll_up(ScrollStep::half_pages(n)); break;
    case CommandKind::MoveLeftHalfPages: pane_.scroll_left(ScrollStep::half_pages(n)); break;
    case CommandKind::MoveRightHalfPages: pane_.scroll_right(ScrollStep::half_pages(n)); break;
    case CommandKind::MoveDownPages: pane_.scroll_down(ScrollStep::pages(n)); break;
    case CommandKind::MoveUpPages: pane_.scroll_up(ScrollStep::pages(n)); break;
    case CommandKind::MoveToHeadOfLine: pane_.goto_head_of_line(); break;
    case CommandKind::MoveToEndOfLine: pane_.goto_tail_of_line(); break;
    case CommandKind::MoveToTopOfLines: pane_.goto_top_of_lines(); break;
    case CommandKind::MoveToBottomOfLines: pane_.goto_bottom_of_lines(); break;
    case CommandKind::MoveToLineNumber: pane_.goto_absolute_line(n); break;
    case CommandKind::ToggleLineNumberPrinting: pane_.show_line_number(!pane_.line_number_shown()); break;
    case CommandKind::ToggleLineWraps: pane_.set_wrap(!pane_.wraps()); break;
    case CommandKind::IncrementLines: pane_.increment_height(n); break;
    case CommandKind::DecrementLines: pane_.decrement_height(n); break;
    case CommandKind::SetNumOfLines: pane_.set_height(n); break;
    case CommandKind::SearchIncremental: {
      const std::string text = c.text.value_or("");
      if (update_search(text) && !text.empty()) jump_to_match(pane_.position().y, false);
      break;
    }
    case CommandKind::SearchTrigger:
      pane_.set_message(std::nullopt);
      break;
    case CommandKind::SearchNext: {
      int last = buf_->line_count() - 1;
      jump_to_match(std::min(pane_.position().y + 1, last), false);
      pane_.set_message(std::nullopt);
      break;
    }
    case CommandKind::SearchPrev:
      jump_to_match(std::max(pane_.position().y - 1, 0), true);
      pane_.set_message(std::nullopt);
      break;
    case CommandKind::Message:
      pane_.set_message(c.text);
      break;
    case CommandKind::Cancel:
      clear_search();
      pane_.set_message(std::nullopt);
      break;
    case CommandKind::FollowMode:
      enter_follow();
      break;
    case CommandKind::FileUpdated:
      reload();
      break;
    case CommandKind::Interrupt: {
      // ring the bell once, then drop the message
      pane_.set_message(term_.caps().alert);
      bool ok = pane_.refresh();
      pane_.set_message(std::nullopt);
      return ok;
    }
    case CommandKind::Resize:
      return resize();
    case CommandKind::Quit:
    case CommandKind::QuitWithClear:
      return handle_quit(c);
  }
  return pane_.refresh();
}

bool App::handle_follow(const Command& c) {
  switch (c.kind) {
    case CommandKind::IncrementLines: pane_.increment_height(c.count); break;
    case CommandKind::DecrementLines: pane_.decrement_height(c.count); break;
    case CommandKind::SetNumOfLines: pane_.set_height(c.count); break;
    case CommandKind::ToggleLineNumberPrinting: pane_.show_line_number(!pane_.line_number_shown()); break;
    case CommandKind::ToggleLineWraps: pane_.set_wrap(!pane_.wraps()); break;
    case CommandKind::SearchIncremental:
      // highlight only, the pane stays pinned to the bottom
      update_search(c.text.value_or(""));
      return pane_.refresh();
    case CommandKind::SearchTrigger:
      pane_.set_message(std::string(kFollowBanner));
      return pane_.refresh();
    case CommandKind::Cancel:
      clear_search();
      pane_.set_message(std::string(kFollowBanner));
      return pane_.refresh();
    case CommandKind::FileUpdated:
      reload();
      break;
    case CommandKind::FollowMode:
    case CommandKind::Interrupt:
      leave_follow();
      return pane_.refresh();
    case CommandKind::Resize:
      return resize();
    case CommandKind::Quit:
    case CommandKind::QuitWithClear:
      return handle_quit(c);
    default:
      return true;
  }
  pane_.goto_bottom_of_lines();
  return pane_.refresh();
}

// ---- producers ----

static void read_keys(int tty_fd, std::shared_ptr<CommandQueue> q, std::shared_ptr<StopFlag> stop) {
  KeyDecoder decoder(tty_fd);
  KeyBind kb;
  for (;;) {
    Key k;
    std::string msg;
    if (!decoder.next(k, msg)) {
      if (stop->load()) return;
      spdlog::warn("key input closed: {}", msg);
      q->push(Command::of(CommandKind::Quit));
      return;
    }
    if (stop->load()) return;
    auto c = kb.parse(k);
    if (!c) continue;
    q->push(*c);
    if (c->kind == CommandKind::Quit || c->kind == CommandKind::QuitWithClear) return;
  }
}

static void watch_source(std::shared_ptr<IFileWatch> watcher, std::shared_ptr<CommandQueue> q,
                         std::shared_ptr<StopFlag> stop) {
  while (!stop->load()) {
    std::string msg;
    WatchResult r = watcher->watch(MPAGE_WATCH_TIMEOUT_MS, msg);
    if (stop->load()) return;
    switch (r) {
      case WatchResult::Timeout:
        break;
      case WatchResult::Changed:
        q->push(Command::of(CommandKind::FileUpdated));
        break;
      case WatchResult::ChangedHangup:
        q->push(Command::of(CommandKind::FileUpdated));
        spdlog::info("source hung up, watcher stopped");
        return;
      case WatchResult::Error:
        spdlog::warn("watch failed: {}", msg);
        std::this_thread::sleep_for(std::chrono::milliseconds(App::kWatchErrorBackoffMs));
        break;
    }
  }
}

static void wait_signals(sigset_t set, std::shared_ptr<CommandQueue> q, std::shared_ptr<StopFlag> stop) {
  for (;;) {
    int sig = 0;
    if (::sigwait(&set, &sig) != 0) {
      spdlog::error("sigwait failed");
      return;
    }
    if (stop->load()) return;
    switch (sig) {
      case SIGINT: q->push(Command::of(CommandKind::Interrupt)); break;
      case SIGWINCH: q->push(Command::of(CommandKind::Resize)); break;
      case SIGTERM:
      case SIGHUP:
        spdlog::info("terminated by signal {}", sig);
        q->push(Command::of(CommandKind::Quit));
        return;
      default: break;
    }
  }
}

int App::run(int tty_fd, std::unique_ptr<IFileWatch> watcher, std::string& msg) {
  auto raw = Terminal::acquire(tty_fd, msg);
  if (!raw) return 1;

  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGHUP);
  sigaddset(&set, SIGWINCH);
  // blocked before any thread starts so every thread inherits the mask
  if (::pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
    msg = "can not block signals";
    return 1;
  }

  auto q = std::make_shared<CommandQueue>();
  auto stop = std::make_shared<StopFlag>(false);
  std::thread(read_keys, tty_fd, q, stop).detach();
  if (watcher) {
    spdlog::info("watcher backend: {}", watcher->name());
    std::thread(watch_source, std::shared_ptr<IFileWatch>(std::move(watcher)), q, stop).detach();
  }
  std::thread(wait_signals, set, q, stop).detach();

  int code = 0;
  if (!begin()) code = 1;
  while (code == 0 && !should_quit_) {
    Command c = q->pop();
    if (!handle(c)) code = 1;
  }
  stop->store(true);
  if (code != 0) {
    msg = "terminal write failed";
    spdlog::error("{}", msg);
  }
  spdlog::info("session ended (exit code {})", code);
  return code;
}
