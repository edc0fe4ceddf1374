#pragma once
/*
 * KeyBind
 *
 * Purpose: pure key-to-Command state machine (no I/O).
 * States: Ready -> Numbering (count prefix) / Commanding (binding lookup) / IncSearching ('/').
 * Table: key-token sequence -> Command; multi-key bindings wait in Commanding
 *        while the typed keys are a prefix of some binding.
 */
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "command.hpp"
#include "key_decoder.hpp"

class KeyBind {
public:
  enum class State { Ready, Numbering, IncSearching, Commanding };

  KeyBind();

  std::optional<Command> parse(const Key& k);
  void bind(const std::vector<Key>& keys, Command c);
  void reset();
  State state() const { return state_; }

private:
  std::optional<Command> parse_ready(const Key& k);
  std::optional<Command> parse_numbering(const Key& k);
  std::optional<Command> parse_commanding(const Key& k);
  std::optional<Command> parse_searching(const Key& k);
  std::optional<Command> with_count(const Command& c) const;

  State state_ = State::Ready;
  int number_ = 0;
  std::string text_;
  std::vector<std::string> keys_;
  std::map<std::vector<std::string>, Command> table_;
};
