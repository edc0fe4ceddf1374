#include "key_decoder.hpp"
#include <cassert>
#include <string>
#include <unistd.h>

static void write_all(int fd, const std::string& s) {
  ssize_t n = ::write(fd, s.data(), s.size());
  assert(n == static_cast<ssize_t>(s.size()));
}

static Key next_key(KeyDecoder& d) {
  Key k;
  std::string msg;
  bool ok = d.next(k, msg);
  assert(ok);
  return k;
}

int main() {
  int p[2];
  assert(::pipe(p) == 0);
  KeyDecoder d(p[0]);

  write_all(p[1], "j\x04\r\n\x7f\x08 ");
  assert(next_key(d) == Key::character('j'));
  assert(next_key(d) == Key::ctrl('d'));
  assert(next_key(d) == Key::of(KeyType::Enter));
  assert(next_key(d) == Key::of(KeyType::Enter));
  assert(next_key(d) == Key::of(KeyType::Backspace));
  assert(next_key(d) == Key::of(KeyType::Backspace));
  assert(next_key(d) == Key::character(' '));

  write_all(p[1], "\x1b[A\x1b[B\x1b[C\x1b[D\x1bOA\x1bOB\x1b[H\x1b[F");
  assert(next_key(d) == Key::of(KeyType::Up));
  assert(next_key(d) == Key::of(KeyType::Down));
  assert(next_key(d) == Key::of(KeyType::Right));
  assert(next_key(d) == Key::of(KeyType::Left));
  assert(next_key(d) == Key::of(KeyType::Up));
  assert(next_key(d) == Key::of(KeyType::Down));
  assert(next_key(d) == Key::of(KeyType::Home));
  assert(next_key(d) == Key::of(KeyType::End));

  write_all(p[1], "\x1b[5~\x1b[6~\x1b[3~\x1b[1~\x1b[4~\x1b[1;5A");
  assert(next_key(d) == Key::of(KeyType::PageUp));
  assert(next_key(d) == Key::of(KeyType::PageDown));
  assert(next_key(d) == Key::of(KeyType::Delete));
  assert(next_key(d) == Key::of(KeyType::Home));
  assert(next_key(d) == Key::of(KeyType::End));
  assert(next_key(d) == Key::of(KeyType::Up));

  write_all(p[1], "あé");
  assert(next_key(d) == Key::character(U'あ'));
  assert(next_key(d) == Key::character(U'é'));

  // a lone ESC is reported once the follow-up delay passes
  write_all(p[1], "\x1b");
  assert(next_key(d) == Key::of(KeyType::Esc));
  // ESC followed by a plain key: Escape, then the key
  write_all(p[1], "\x1bx");
  assert(next_key(d) == Key::of(KeyType::Esc));
  assert(next_key(d) == Key::character('x'));

  assert(Key::character('j').token() == "j");
  assert(Key::character(U'あ').token() == "あ");
  assert(Key::ctrl('d').token() == "^D");
  assert(Key::of(KeyType::PageDown).token() == "<PageDown>");

  ::close(p[1]);
  Key k;
  std::string msg;
  assert(!d.next(k, msg));
  assert(!msg.empty());
  ::close(p[0]);
  return 0;
}
