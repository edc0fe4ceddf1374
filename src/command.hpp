#pragma once
/*
 * Command
 *
 * Purpose: the single event type flowing through the app channel.
 * Producers: KeyBind (keys), watcher (FileUpdated), signals (Interrupt/Resize/Quit).
 * Note: count is the repeat count or line number; text carries search/message text.
 */
#include <optional>
#include <string>

enum class CommandKind {
  MoveDown, MoveUp, MoveLeft, MoveRight,
  MoveDownHalfPages, MoveUpHalfPages, MoveLeftHalfPages, MoveRightHalfPages,
  MoveDownPages, MoveUpPages,
  MoveToHeadOfLine, MoveToEndOfLine, MoveToTopOfLines, MoveToBottomOfLines,
  MoveToLineNumber,
  ToggleLineNumberPrinting, ToggleLineWraps,
  IncrementLines, DecrementLines, SetNumOfLines,
  SearchIncremental, SearchTrigger, SearchNext, SearchPrev,
  Message, Cancel,
  Quit, QuitWithClear,
  FollowMode, FileUpdated, Interrupt, Resize
};

struct Command {
  CommandKind kind = CommandKind::Cancel;
  int count = 0;
  std::optional<std::string> text;

  static Command of(CommandKind k, int n = 0) { return {k, n, std::nullopt}; }
  static Command search_incremental(std::string s) { return {CommandKind::SearchIncremental, 0, std::move(s)}; }
  static Command message(std::optional<std::string> s) { return {CommandKind::Message, 0, std::move(s)}; }

  bool operator==(const Command& o) const { return kind == o.kind && count == o.count && text == o.text; }
};

const char* to_string(CommandKind k);
// e.g. "MoveDown(2)", "SearchIncremental(\"ab\")"; for logs and test messages
std::string to_string(const Command& c);
