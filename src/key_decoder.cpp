#include "key_decoder.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "unicode_divide.hpp"

std::string Key::token() const {
  switch (type) {
    case KeyType::Char: { std::string s; append_utf8(s, ch); return s; }
    case KeyType::Ctrl: return std::string("^") + static_cast<char>(ch - 'a' + 'A');
    case KeyType::Esc: return "<Esc>";
    case KeyType::Enter: return "<Enter>";
    case KeyType::Backspace: return "<BS>";
    case KeyType::Delete: return "<Del>";
    case KeyType::Up: return "<Up>";
    case KeyType::Down: return "<Down>";
    case KeyType::Left: return "<Left>";
    case KeyType::Right: return "<Right>";
    case KeyType::Home: return "<Home>";
    case KeyType::End: return "<End>";
    case KeyType::PageUp: return "<PageUp>";
    case KeyType::PageDown: return "<PageDown>";
    case KeyType::Unknown: break;
  }
  return "<Unknown>";
}

int KeyDecoder::read_byte(unsigned char& b, int timeout_ms, std::string& msg) {
  if (pending_.empty()) {
    struct pollfd pfd{fd_, POLLIN, 0};
    int r;
    do { r = ::poll(&pfd, 1, timeout_ms); } while (r < 0 && errno == EINTR);
    if (r < 0) { msg = std::string("poll: ") + std::strerror(errno); return -1; }
    if (r == 0) return 0;
    char buf[64];
    ssize_t n;
    do { n = ::read(fd_, buf, sizeof(buf)); } while (n < 0 && errno == EINTR);
    if (n < 0) { msg = std::string("read: ") + std::strerror(errno); return -1; }
    if (n == 0) { msg = "end of terminal input"; return -1; }
    pending_.append(buf, static_cast<size_t>(n));
  }
  b = static_cast<unsigned char>(pending_.front());
  pending_.erase(0, 1);
  return 1;
}

static Key csi_tilde(int param) {
  switch (param) {
    case 1: case 7: return Key::of(KeyType::Home);
    case 4: case 8: return Key::of(KeyType::End);
    case 3: return Key::of(KeyType::Delete);
    case 5: return Key::of(KeyType::PageUp);
    case 6: return Key::of(KeyType::PageDown);
    default: return Key::of(KeyType::Unknown);
  }
}

static Key final_letter(unsigned char c) {
  switch (c) {
    case 'A': return Key::of(KeyType::Up);
    case 'B': return Key::of(KeyType::Down);
    case 'C': return Key::of(KeyType::Right);
    case 'D': return Key::of(KeyType::Left);
    case 'H': return Key::of(KeyType::Home);
    case 'F': return Key::of(KeyType::End);
    default: return Key::of(KeyType::Unknown);
  }
}

Key KeyDecoder::decode_escape(std::string& msg, bool& failed) {
  unsigned char b = 0;
  int r = read_byte(b, esc_delay_ms_, msg);
  if (r < 0) { failed = true; return Key::of(KeyType::Unknown); }
  if (r == 0) return Key::of(KeyType::Esc);
  if (b == 'O') {
    r = read_byte(b, esc_delay_ms_, msg);
    if (r < 0) { failed = true; return Key::of(KeyType::Unknown); }
    if (r == 0) return Key::of(KeyType::Unknown);
    return final_letter(b);
  }
  if (b != '[') {
    // Alt+key or a fast typist: report Escape and keep the byte for the next key
    pending_.insert(pending_.begin(), static_cast<char>(b));
    return Key::of(KeyType::Esc);
  }
  int param = 0;
  for (;;) {
    r = read_byte(b, esc_delay_ms_, msg);
    if (r < 0) { failed = true; return Key::of(KeyType::Unknown); }
    if (r == 0) return Key::of(KeyType::Unknown);
    if (b >= '0' && b <= '9') { param = param * 10 + (b - '0'); continue; }
    if (b == ';') { param = 0; continue; }
    if (b >= 0x40 && b <= 0x7e) break;
  }
  if (b == '~') return csi_tilde(param);
  return final_letter(b);
}

static int utf8_length(unsigned char lead) {
  if (lead >= 0xf0 && lead < 0xf8) return 4;
  if (lead >= 0xe0) return lead < 0xf0 ? 3 : 1;
  if (lead >= 0xc0) return 2;
  return 1;
}

bool KeyDecoder::next(Key& out, std::string& msg) {
  unsigned char b = 0;
  if (read_byte(b, -1, msg) < 0) return false;
  if (b == 0x1b) {
    bool failed = false;
    out = decode_escape(msg, failed);
    return !failed;
  }
  if (b == '\r' || b == '\n') { out = Key::of(KeyType::Enter); return true; }
  if (b == 0x7f || b == 0x08) { out = Key::of(KeyType::Backspace); return true; }
  if (b >= 1 && b <= 26) { out = Key::ctrl(static_cast<char>('a' + b - 1)); return true; }
  if (b < 0x20) { out = Key::of(KeyType::Unknown); return true; }
  if (b < 0x80) { out = Key::character(b); return true; }

  std::string seq(1, static_cast<char>(b));
  int len = utf8_length(b);
  for (int i = 1; i < len; ++i) {
    unsigned char c = 0;
    int r = read_byte(c, esc_delay_ms_, msg);
    if (r < 0) return false;
    if (r == 0) break;
    if ((c & 0xc0) != 0x80) { pending_.insert(pending_.begin(), static_cast<char>(c)); break; }
    seq.push_back(static_cast<char>(c));
  }
  size_t i = 0;
  out = Key::character(next_codepoint(seq, i));
  return true;
}
