#include "keybind.hpp"
#include <cassert>
#include <climits>
#include <string>
#include <vector>

static Key ch(char32_t c) { return Key::character(c); }
static Key named(KeyType t) { return Key::of(t); }

static std::vector<Command> feed(KeyBind& kb, const std::vector<Key>& keys) {
  std::vector<Command> out;
  for (const Key& k : keys) {
    if (auto c = kb.parse(k)) out.push_back(*c);
  }
  return out;
}

static std::vector<Command> fresh(const std::vector<Key>& keys) {
  KeyBind kb;
  return feed(kb, keys);
}

static Command cmd(CommandKind k, int n = 0) { return Command::of(k, n); }

static void test_counts() {
  assert((fresh({ch('2'), ch('j')}) == std::vector<Command>{cmd(CommandKind::MoveDown, 2)}));
  assert((fresh({ch('1'), ch('0'), ch('=')}) == std::vector<Command>{cmd(CommandKind::SetNumOfLines, 10)}));
  assert((fresh({ch('1'), ch('0'), ch('h')}) == std::vector<Command>{cmd(CommandKind::MoveLeft, 10)}));
  assert((fresh({ch('1'), ch('0'), ch('0'), ch('k')}) == std::vector<Command>{cmd(CommandKind::MoveUp, 100)}));
  assert((fresh({ch('j')}) == std::vector<Command>{cmd(CommandKind::MoveDown, 1)}));
  assert((fresh({ch('3'), ch('+')}) == std::vector<Command>{cmd(CommandKind::IncrementLines, 3)}));
  assert((fresh({ch('-')}) == std::vector<Command>{cmd(CommandKind::DecrementLines, 1)}));

  // no number typed: "=" has nothing to set
  assert(fresh({ch('=')}).empty());

  // a count is dropped silently, unlike Esc in Ready
  KeyBind kb;
  assert(feed(kb, {ch('1'), ch('2'), named(KeyType::Enter)}).empty());
  assert(kb.state() == KeyBind::State::Ready);
  assert(feed(kb, {ch('1'), ch('2'), named(KeyType::Esc)}).empty());
  assert(kb.state() == KeyBind::State::Ready);
  assert((feed(kb, {named(KeyType::Esc)}) == std::vector<Command>{cmd(CommandKind::Cancel)}));
  // the dropped count does not leak into the next command
  assert((feed(kb, {ch('j')}) == std::vector<Command>{cmd(CommandKind::MoveDown, 1)}));

  auto big = fresh({ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('9'), ch('j')});
  assert(big.size() == 1 && big[0].count == INT_MAX);
}

static void test_jumps() {
  assert((fresh({ch('g')}) == std::vector<Command>{cmd(CommandKind::MoveToTopOfLines)}));
  assert((fresh({ch('G')}) == std::vector<Command>{cmd(CommandKind::MoveToBottomOfLines)}));
  assert((fresh({ch('5'), ch('g')}) == std::vector<Command>{cmd(CommandKind::MoveToLineNumber, 4)}));
  assert((fresh({ch('3'), ch('G')}) == std::vector<Command>{cmd(CommandKind::MoveToLineNumber, 2)}));
  assert((fresh({ch('1'), ch('<')}) == std::vector<Command>{cmd(CommandKind::MoveToLineNumber, 0)}));
  assert((fresh({ch('0')}) == std::vector<Command>{cmd(CommandKind::MoveToHeadOfLine)}));
  assert((fresh({ch('$')}) == std::vector<Command>{cmd(CommandKind::MoveToEndOfLine)}));
}

static void test_named_keys() {
  assert((fresh({named(KeyType::Down)}) == std::vector<Command>{cmd(CommandKind::MoveDown, 1)}));
  assert((fresh({named(KeyType::Enter)}) == std::vector<Command>{cmd(CommandKind::MoveDown, 1)}));
  assert((fresh({Key::ctrl('p')}) == std::vector<Command>{cmd(CommandKind::MoveUp, 1)}));
  assert((fresh({Key::ctrl('f')}) == std::vector<Command>{cmd(CommandKind::MoveDownPages, 1)}));
  assert((fresh({ch(' ')}) == std::vector<Command>{cmd(CommandKind::MoveDownPages, 1)}));
  assert((fresh({ch('2'), named(KeyType::PageUp)}) == std::vector<Command>{cmd(CommandKind::MoveUpPages, 2)}));
  assert((fresh({named(KeyType::Home)}) == std::vector<Command>{cmd(CommandKind::MoveToHeadOfLine)}));
  assert((fresh({ch('#'), ch('!')}) == std::vector<Command>{cmd(CommandKind::ToggleLineNumberPrinting), cmd(CommandKind::ToggleLineWraps)}));
  assert((fresh({ch('F')}) == std::vector<Command>{cmd(CommandKind::FollowMode)}));
}

static void test_multi_key() {
  KeyBind kb;
  assert(feed(kb, {ch('Z')}).empty());
  assert(kb.state() == KeyBind::State::Commanding);
  assert((feed(kb, {ch('Z')}) == std::vector<Command>{cmd(CommandKind::Quit)}));
  assert((feed(kb, {ch('Z'), ch('Q')}) == std::vector<Command>{cmd(CommandKind::QuitWithClear)}));
  assert((feed(kb, {ch('Z'), ch('x')}) == std::vector<Command>{Command::message(std::nullopt)}));
  assert(kb.state() == KeyBind::State::Ready);

  // unbound key clears the message
  assert((fresh({ch('x')}) == std::vector<Command>{Command::message(std::nullopt)}));
  assert((fresh({named(KeyType::Backspace)}) == std::vector<Command>{Command::message(std::nullopt)}));

  KeyBind custom;
  custom.bind({ch('x')}, cmd(CommandKind::Quit));
  custom.bind({ch('g'), ch('o')}, cmd(CommandKind::FollowMode));
  assert((feed(custom, {ch('x')}) == std::vector<Command>{cmd(CommandKind::Quit)}));
  // "g" is now also a prefix, so it resolves as itself immediately
  assert((feed(custom, {ch('g')}) == std::vector<Command>{cmd(CommandKind::MoveToTopOfLines)}));
}

static void test_search() {
  auto out = fresh({ch('/'), ch('a'), ch('b'), named(KeyType::Backspace), named(KeyType::Backspace), named(KeyType::Backspace)});
  assert((out == std::vector<Command>{
    Command::search_incremental(""),
    Command::search_incremental("a"),
    Command::search_incremental("ab"),
    Command::search_incremental("a"),
    Command::search_incremental(""),
    cmd(CommandKind::Cancel)}));

  KeyBind kb;
  out = feed(kb, {ch('/'), ch('x'), Key::ctrl('d'), named(KeyType::Enter)});
  assert((out == std::vector<Command>{
    Command::search_incremental(""),
    Command::search_incremental("x"),
    cmd(CommandKind::SearchTrigger)}));
  assert(kb.state() == KeyBind::State::Ready);
  assert((feed(kb, {ch('n'), ch('N')}) == std::vector<Command>{cmd(CommandKind::SearchNext), cmd(CommandKind::SearchPrev)}));

  out = fresh({ch('/'), ch('q'), named(KeyType::Esc)});
  assert(out.size() == 3 && out[2] == cmd(CommandKind::Cancel));

  // digits and bound keys are search text here
  out = fresh({ch('/'), ch('1'), ch('j')});
  assert(out.back() == Command::search_incremental("1j"));

  out = fresh({ch('/'), ch(U'é'), named(KeyType::Delete)});
  assert((out == std::vector<Command>{
    Command::search_incremental(""),
    Command::search_incremental("é"),
    Command::search_incremental("")}));
}

int main() {
  test_counts();
  test_jumps();
  test_named_keys();
  test_multi_key();
  test_search();
  return 0;
}
