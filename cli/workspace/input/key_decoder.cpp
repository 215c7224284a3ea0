#include "key_decoder.h"

#include "util/utf8.h"

namespace sqlterm::cli {

namespace {

constexpr unsigned char kEsc = 27;

/// Applies an xterm modifier parameter (2 = shift, 3 = alt, 5 = ctrl, combinations add).
void apply_modifier(KeyInput& input, int modifier) {
  if (modifier < 2) return;
  int bits = modifier - 1;
  input.shift = (bits & 1) != 0;
  input.alt = (bits & 2) != 0;
  input.ctrl = (bits & 4) != 0;
}

bool final_letter_key(char c, Key& key) {
  switch (c) {
    case 'A':
      key = Key::Up;
      return true;
    case 'B':
      key = Key::Down;
      return true;
    case 'C':
      key = Key::Right;
      return true;
    case 'D':
      key = Key::Left;
      return true;
    case 'H':
      key = Key::Home;
      return true;
    case 'F':
      key = Key::End;
      return true;
    default:
      return false;
  }
}

bool tilde_key(int code, Key& key) {
  switch (code) {
    case 1:
    case 7:
      key = Key::Home;
      return true;
    case 3:
      key = Key::Delete;
      return true;
    case 4:
    case 8:
      key = Key::End;
      return true;
    case 5:
      key = Key::PageUp;
      return true;
    case 6:
      key = Key::PageDown;
      return true;
    case 15:
      key = Key::F5;
      return true;
    default:
      return false;
  }
}

/// Decodes "ESC [ params final". Returns bytes consumed, 0 when incomplete.
/// Unknown sequences are consumed and decode to Key::Null.
size_t decode_csi(const std::string& bytes, size_t start, KeyInput& input) {
  size_t i = start + 2;
  int params[2] = {0, 0};
  int count = 0;
  bool have_digit = false;
  while (i < bytes.size()) {
    char c = bytes[i];
    if (c >= '0' && c <= '9') {
      // Parameters past four digits name no key; stop growing them.
      if (count < 2 && params[count] < 1000) params[count] = params[count] * 10 + (c - '0');
      have_digit = true;
      ++i;
      continue;
    }
    if (c == ';') {
      ++count;
      ++i;
      continue;
    }
    if (have_digit || count > 0) ++count;
    Key key = Key::Null;
    if (c == '~') {
      if (tilde_key(params[0], key)) {
        input = KeyInput::special(key);
        if (count > 1) apply_modifier(input, params[1]);
      }
    } else if (final_letter_key(c, key)) {
      input = KeyInput::special(key);
      if (count > 1) apply_modifier(input, params[1]);
    }
    return i + 1 - start;
  }
  return 0;
}

}  // namespace

size_t decode_keys(const std::string& bytes, std::vector<KeyInput>& out, bool flush) {
  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    if (c == kEsc) {
      if (i + 1 >= bytes.size()) {
        if (!flush) break;
        out.push_back(KeyInput::special(Key::Esc));
        ++i;
        continue;
      }
      char next = bytes[i + 1];
      if (next == '[') {
        KeyInput input;
        size_t used = decode_csi(bytes, i, input);
        if (used == 0) {
          if (!flush) break;
          // Truncated sequence at a flush boundary: drop it.
          i = bytes.size();
          continue;
        }
        if (input.key != Key::Null) out.push_back(input);
        i += used;
        continue;
      }
      if (next == 'O') {
        if (i + 2 >= bytes.size()) {
          if (!flush) break;
          i = bytes.size();
          continue;
        }
        Key key = Key::Null;
        if (final_letter_key(bytes[i + 2], key)) {
          out.push_back(KeyInput::special(key));
        }
        i += 3;
        continue;
      }
      if (static_cast<unsigned char>(next) == kEsc) {
        out.push_back(KeyInput::special(Key::Esc));
        ++i;
        continue;
      }
      // ESC followed by a printable byte is an alt chord.
      size_t len = 0;
      uint32_t cp = util::decode_utf8(bytes, i + 1, &len);
      KeyInput input = KeyInput::character(static_cast<char32_t>(cp));
      input.alt = true;
      out.push_back(input);
      i += 1 + len;
      continue;
    }
    if (c == '\r' || c == '\n') {
      out.push_back(KeyInput::special(Key::Enter));
      ++i;
      continue;
    }
    if (c == '\t') {
      out.push_back(KeyInput::special(Key::Tab));
      ++i;
      continue;
    }
    if (c == 127 || c == 8) {
      out.push_back(KeyInput::special(Key::Backspace));
      ++i;
      continue;
    }
    if (c >= 1 && c <= 26) {
      out.push_back(KeyInput::control(static_cast<char32_t>('a' + c - 1)));
      ++i;
      continue;
    }
    if (c < 32) {
      ++i;
      continue;
    }
    size_t len = util::utf8_sequence_length(c);
    if (i + len > bytes.size() && !flush) break;
    size_t used = 0;
    uint32_t cp = util::decode_utf8(bytes, i, &used);
    out.push_back(KeyInput::character(static_cast<char32_t>(cp)));
    i += used == 0 ? 1 : used;
  }
  return i;
}

void KeyDecoder::feed(const std::string& bytes) {
  compact();
  pending_ += bytes;
  size_t used = decode_keys(pending_, keys_, false);
  pending_.erase(0, used);
}

void KeyDecoder::flush() {
  if (pending_.empty()) return;
  compact();
  size_t used = decode_keys(pending_, keys_, true);
  pending_.erase(0, used);
}

KeyInput KeyDecoder::pop() {
  if (!has_key()) return KeyInput{};
  return keys_[next_++];
}

void KeyDecoder::compact() {
  if (next_ == 0) return;
  keys_.erase(keys_.begin(), keys_.begin() + static_cast<long>(next_));
  next_ = 0;
}

}  // namespace sqlterm::cli
