#include "command.hpp"

const char* to_string(CommandKind k) {
  switch (k) {
    case CommandKind::MoveDown: return "MoveDown";
    case CommandKind::MoveUp: return "MoveUp";
    case CommandKind::MoveLeft: return "MoveLeft";
    case CommandKind::MoveRight: return "MoveRight";
    case CommandKind::MoveDownHalfPages: return "MoveDownHalfPages";
    case CommandKind::MoveUpHalfPages: return "MoveUpHalfPages";
    case CommandKind::MoveLeftHalfPages: return "MoveLeftHalfPages";
    case CommandKind::MoveRightHalfPages: return "MoveRightHalfPages";
    case CommandKind::MoveDownPages: return "MoveDownPages";
    case CommandKind::MoveUpPages: return "MoveUpPages";
    case CommandKind::MoveToHeadOfLine: return "MoveToHeadOfLine";
    case CommandKind::MoveToEndOfLine: return "MoveToEndOfLine";
    case CommandKind::MoveToTopOfLines: return "MoveToTopOfLines";
    case CommandKind::MoveToBottomOfLines: return "MoveToBottomOfLines";
    case CommandKind::MoveToLineNumber: return "MoveToLineNumber";
    case CommandKind::ToggleLineNumberPrinting: return "ToggleLineNumberPrinting";
    case CommandKind::ToggleLineWraps: return "ToggleLineWraps";
    case CommandKind::IncrementLines: return "IncrementLines";
    case CommandKind::DecrementLines: return "DecrementLines";
    case CommandKind::SetNumOfLines: return "SetNumOfLines";
    case CommandKind::SearchIncremental: return "SearchIncremental";
    case CommandKind::SearchTrigger: return "SearchTrigger";
    case CommandKind::SearchNext: return "SearchNext";
    case CommandKind::SearchPrev: return "SearchPrev";
    case CommandKind::Message: return "Message";
    case CommandKind::Cancel: return "Cancel";
    case CommandKind::Quit: return "Quit";
    case CommandKind::QuitWithClear: return "QuitWithClear";
    case CommandKind::FollowMode: return "FollowMode";
    case CommandKind::FileUpdated: return "FileUpdated";
    case CommandKind::Interrupt: return "Interrupt";
    case CommandKind::Resize: return "Resize";
  }
  return "?";
}

std::string to_string(const Command& c) {
  std::string s = to_string(c.kind);
  if (c.text) return s + "(\"" + *c.text + "\")";
  if (c.count != 0) return s + "(" + std::to_string(c.count) + ")";
  return s;
}
