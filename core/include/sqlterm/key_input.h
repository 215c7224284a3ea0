#pragma once

namespace sqlterm {

/// Identifies the logical key of a press event after terminal decoding.
/// MUST stay independent of any terminal library so the core remains testable.
enum class Key {
  Null,
  Char,
  Enter,
  Tab,
  Backspace,
  Delete,
  Esc,
  Left,
  Right,
  Up,
  Down,
  Home,
  End,
  PageUp,
  PageDown,
  F5,
};

/// Represents one discrete key press with its modifier flags.
/// MUST carry a Unicode scalar in ch only when key == Key::Char.
/// Inputs are decoded terminal bytes; outputs are value comparisons with no side effects.
struct KeyInput {
  Key key = Key::Null;
  char32_t ch = 0;
  bool ctrl = false;
  bool alt = false;
  bool shift = false;

  static KeyInput character(char32_t c) {
    KeyInput input;
    input.key = Key::Char;
    input.ch = c;
    return input;
  }

  static KeyInput control(char32_t c) {
    KeyInput input = character(c);
    input.ctrl = true;
    return input;
  }

  static KeyInput special(Key k) {
    KeyInput input;
    input.key = k;
    return input;
  }

  /// True for an unmodified character press of c.
  bool is_char(char32_t c) const {
    return key == Key::Char && ch == c && !ctrl && !alt;
  }

  bool is_ctrl(char32_t c) const {
    return key == Key::Char && ch == c && ctrl;
  }

  bool operator==(const KeyInput& other) const {
    return key == other.key && ch == other.ch && ctrl == other.ctrl && alt == other.alt &&
           shift == other.shift;
  }

  bool operator!=(const KeyInput& other) const { return !(*this == other); }
};

}  // namespace sqlterm
