#include "keybind.hpp"
#include <algorithm>
#include <climits>
#include <initializer_list>
#include "unicode_divide.hpp"

// Key input state transition
//
// | State        | '/'          | 1-9       | other keys | Enter        | Esc           |
// | ------------ | ------------ | --------- | ---------- | ------------ | ------------- |
// | Ready        | IncSearching | Numbering | Commanding | Commanding   | Cancel        |
// | Numbering    | Commanding   | (0-9)     | Commanding | Ready        | Ready         |
// | IncSearching | (append)     | (append)  | (append)   | SearchTrigger| Cancel        |
//
// Commanding resolves the typed keys against the table: a full match emits the
// command, a prefix waits for more keys, anything else clears the message.

static bool is_named(KeyType t) {
  return t != KeyType::Char && t != KeyType::Unknown;
}

KeyBind::KeyBind() {
  using K = CommandKind;
  auto ch = [](char c) { return Key::character(static_cast<unsigned char>(c)); };
  auto add = [this](std::initializer_list<Key> keys, CommandKind kind) {
    for (const Key& k : keys) bind({k}, Command::of(kind));
  };
  add({ch('j'), Key::ctrl('n'), Key::of(KeyType::Enter), Key::of(KeyType::Down)}, K::MoveDown);
  add({ch('k'), Key::ctrl('k'), Key::ctrl('p'), Key::of(KeyType::Up)}, K::MoveUp);
  add({ch('h'), Key::of(KeyType::Left)}, K::MoveLeft);
  add({ch('l'), Key::of(KeyType::Right)}, K::MoveRight);
  add({ch('d'), Key::ctrl('d')}, K::MoveDownHalfPages);
  add({ch('u'), Key::ctrl('u')}, K::MoveUpHalfPages);
  add({ch('H')}, K::MoveLeftHalfPages);
  add({ch('L')}, K::MoveRightHalfPages);
  add({ch('f'), Key::ctrl('f'), ch(' '), Key::of(KeyType::PageDown)}, K::MoveDownPages);
  add({ch('b'), Key::ctrl('b'), Key::of(KeyType::PageUp)}, K::MoveUpPages);
  add({ch('0'), Key::ctrl('a'), Key::of(KeyType::Home)}, K::MoveToHeadOfLine);
  add({ch('$'), Key::ctrl('e'), Key::of(KeyType::End)}, K::MoveToEndOfLine);
  add({ch('g'), ch('<')}, K::MoveToTopOfLines);
  add({ch('G'), ch('>')}, K::MoveToBottomOfLines);
  add({ch('#')}, K::ToggleLineNumberPrinting);
  add({ch('!')}, K::ToggleLineWraps);
  add({ch('-')}, K::DecrementLines);
  add({ch('+')}, K::IncrementLines);
  add({ch('=')}, K::SetNumOfLines);
  add({ch('n')}, K::SearchNext);
  add({ch('N')}, K::SearchPrev);
  add({ch('q')}, K::Quit);
  add({ch('Q')}, K::QuitWithClear);
  add({ch('F')}, K::FollowMode);
  bind({ch('Z'), ch('Z')}, Command::of(K::Quit));
  bind({ch('Z'), ch('Q')}, Command::of(K::QuitWithClear));
}

void KeyBind::bind(const std::vector<Key>& keys, Command c) {
  std::vector<std::string> tokens;
  tokens.reserve(keys.size());
  for (const Key& k : keys) tokens.push_back(k.token());
  table_[tokens] = std::move(c);
}

void KeyBind::reset() {
  state_ = State::Ready;
  number_ = 0;
  text_.clear();
  keys_.clear();
}

std::optional<Command> KeyBind::parse(const Key& k) {
  switch (state_) {
    case State::Ready: return parse_ready(k);
    case State::Numbering: return parse_numbering(k);
    case State::Commanding: return parse_commanding(k);
    case State::IncSearching: return parse_searching(k);
  }
  return std::nullopt;
}

std::optional<Command> KeyBind::parse_ready(const Key& k) {
  if (k.type == KeyType::Char && k.ch == '/') {
    reset();
    state_ = State::IncSearching;
    return Command::search_incremental("");
  }
  if (k.type == KeyType::Char && k.ch >= '1' && k.ch <= '9') {
    reset();
    state_ = State::Numbering;
    number_ = static_cast<int>(k.ch - '0');
    return std::nullopt;
  }
  if (k.type == KeyType::Esc) {
    reset();
    return Command::of(CommandKind::Cancel);
  }
  if (k.type == KeyType::Char || is_named(k.type)) {
    keys_.clear();
    state_ = State::Commanding;
    return parse_commanding(k);
  }
  return std::nullopt;
}

std::optional<Command> KeyBind::parse_numbering(const Key& k) {
  if (k.type == KeyType::Char && k.ch >= '0' && k.ch <= '9') {
    int d = static_cast<int>(k.ch - '0');
    number_ = number_ > (INT_MAX - d) / 10 ? INT_MAX : number_ * 10 + d;
    return std::nullopt;
  }
  // leaving a count silently, no Cancel
  if (k.type == KeyType::Esc || k.type == KeyType::Enter) {
    reset();
    return std::nullopt;
  }
  if (k.type == KeyType::Char || is_named(k.type)) {
    keys_.clear();
    state_ = State::Commanding;
    return parse_commanding(k);
  }
  return std::nullopt;
}

std::optional<Command> KeyBind::parse_commanding(const Key& k) {
  keys_.push_back(k.token());
  auto it = table_.find(keys_);
  if (it != table_.end()) {
    Command c = it->second;
    auto out = with_count(c);
    reset();
    return out;
  }
  auto lb = table_.lower_bound(keys_);
  if (lb != table_.end() && lb->first.size() > keys_.size() &&
      std::equal(keys_.begin(), keys_.end(), lb->first.begin())) {
    return std::nullopt;
  }
  reset();
  return Command::message(std::nullopt);
}

static void pop_codepoint(std::string& s) {
  while (!s.empty()) {
    unsigned char c = static_cast<unsigned char>(s.back());
    s.pop_back();
    if ((c & 0xc0) != 0x80) break;
  }
}

std::optional<Command> KeyBind::parse_searching(const Key& k) {
  switch (k.type) {
    case KeyType::Char:
      append_utf8(text_, k.ch);
      return Command::search_incremental(text_);
    case KeyType::Backspace:
    case KeyType::Delete:
      if (text_.empty()) {
        reset();
        return Command::of(CommandKind::Cancel);
      }
      pop_codepoint(text_);
      return Command::search_incremental(text_);
    case KeyType::Enter:
      reset();
      return Command::of(CommandKind::SearchTrigger);
    case KeyType::Esc:
      reset();
      return Command::of(CommandKind::Cancel);
    default:
      return std::nullopt;
  }
}

std::optional<Command> KeyBind::with_count(const Command& c) const {
  int n = number_;
  switch (c.kind) {
    case CommandKind::MoveDown:
    case CommandKind::MoveUp:
    case CommandKind::MoveLeft:
    case CommandKind::MoveRight:
    case CommandKind::MoveDownHalfPages:
    case CommandKind::MoveUpHalfPages:
    case CommandKind::MoveLeftHalfPages:
    case CommandKind::MoveRightHalfPages:
    case CommandKind::MoveDownPages:
    case CommandKind::MoveUpPages:
    case CommandKind::IncrementLines:
    case CommandKind::DecrementLines:
      return Command::of(c.kind, n == 0 ? 1 : n);
    case CommandKind::MoveToTopOfLines:
    case CommandKind::MoveToBottomOfLines:
      if (n > 0) return Command::of(CommandKind::MoveToLineNumber, n - 1);
      return c;
    case CommandKind::SetNumOfLines:
      if (n == 0) return std::nullopt;
      return Command::of(c.kind, n);
    default:
      return c;
  }
}
