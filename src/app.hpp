#pragma once
/*
 * App
 *
 * Purpose: session orchestrator. Owns the Pane, the search state and the mode,
 *          and is the single consumer of the Command channel.
 * Producers (run): key reader on the controlling tty, source watcher, signal thread.
 * Modes: Normal (full command set) / Follow (pinned to the newest data).
 * Errors: handle() returns false when the terminal can not be written.
 */
#include <memory>
#include <string>
#include "command.hpp"
#include "file_reader.hpp"
#include "file_watch.hpp"
#include "iterminal.hpp"
#include "line_buffer.hpp"
#include "options.hpp"
#include "pane.hpp"
#include "search.hpp"
#include "types.hpp"

class App {
public:
  static constexpr const char* kFollowBanner = "Waiting for data... (interrupt to abort)";
  static constexpr int kWatchErrorBackoffMs = 100;

  App(ITerminal& term, std::shared_ptr<LineBuffer> buf, std::unique_ptr<ISourceReader> src,
      std::shared_ptr<ISearcher> searcher, const Options& opts);

  // Initial read of the source; a pipe waits MPAGE_PIPE_WAIT_MS for each chunk.
  bool load(std::string& msg);
  // First frame (enters follow mode when requested on the command line).
  bool begin();
  bool handle(const Command& c);

  // Raw mode + producer threads + dispatch loop; returns the exit code.
  int run(int tty_fd, std::unique_ptr<IFileWatch> watcher, std::string& msg);

  bool should_quit() const { return should_quit_; }
  Mode mode() const { return mode_; }
  Pane& pane() { return pane_; }
  const Pane& pane() const { return pane_; }
  const ISearcher& searcher() const { return *searcher_; }

private:
  bool handle_normal(const Command& c);
  bool handle_follow(const Command& c);
  bool handle_quit(const Command& c);
  bool resize();
  void reload();
  // Update the pattern and the status line; false when the pattern was rejected.
  bool update_search(const std::string& text);
  void clear_search();
  void jump_to_match(int from, bool backward);
  void enter_follow();
  void leave_follow();

  ITerminal& term_;
  std::shared_ptr<LineBuffer> buf_;
  std::unique_ptr<ISourceReader> src_;
  std::shared_ptr<ISearcher> searcher_;
  Pane pane_;
  Mode mode_ = Mode::Normal;
  bool start_in_follow_ = false;
  bool should_quit_ = false;
};
