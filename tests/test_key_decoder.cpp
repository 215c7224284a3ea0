#include "test_harness.h"

#include "workspace/input/key_decoder.h"

namespace {

using sqlterm::Key;
using sqlterm::KeyInput;
using sqlterm::cli::KeyDecoder;

std::vector<KeyInput> decode_all(const std::string& bytes) {
  std::vector<KeyInput> keys;
  sqlterm::cli::decode_keys(bytes, keys, true);
  return keys;
}

void test_arrow_keys() {
  auto keys = decode_all("\x1b[A\x1b[B\x1bOC\x1b[D");
  expect_eq(keys.size(), 4, "four arrows");
  if (keys.size() == 4) {
    expect_true(keys[0].key == Key::Up, "up");
    expect_true(keys[1].key == Key::Down, "down");
    expect_true(keys[2].key == Key::Right, "ss3 right");
    expect_true(keys[3].key == Key::Left, "left");
  }
}

void test_tilde_sequences() {
  auto keys = decode_all("\x1b[15~\x1b[3~\x1b[5~\x1b[6~");
  expect_eq(keys.size(), 4, "four keys");
  if (keys.size() == 4) {
    expect_true(keys[0].key == Key::F5, "F5");
    expect_true(keys[1].key == Key::Delete, "delete");
    expect_true(keys[2].key == Key::PageUp, "page up");
    expect_true(keys[3].key == Key::PageDown, "page down");
  }
}

void test_modified_arrow() {
  auto keys = decode_all("\x1b[1;5C");
  expect_eq(keys.size(), 1, "one key");
  if (!keys.empty()) {
    expect_true(keys[0].key == Key::Right, "right");
    expect_true(keys[0].ctrl, "ctrl modifier");
    expect_true(!keys[0].alt && !keys[0].shift, "no other modifiers");
  }
}

void test_unknown_csi_is_consumed() {
  auto keys = decode_all("\x1b[99~x");
  expect_eq(keys.size(), 1, "unknown sequence dropped");
  if (!keys.empty()) expect_true(keys[0].is_char(U'x'), "following char kept");
}

void test_long_csi_parameter() {
  auto keys = decode_all("\x1b[99999999999999999999~x\x1b[1500000000000000000015~");
  expect_eq(keys.size(), 1, "oversized parameters name no key");
  if (!keys.empty()) expect_true(keys[0].is_char(U'x'), "following char kept");
}

void test_lone_escape_waits_for_flush() {
  KeyDecoder decoder;
  decoder.feed("\x1b");
  expect_true(!decoder.has_key(), "lone ESC stays pending");
  decoder.flush();
  expect_true(decoder.has_key(), "flush resolves ESC");
  expect_true(decoder.pop().key == Key::Esc, "decoded ESC");
}

void test_double_escape() {
  KeyDecoder decoder;
  decoder.feed("\x1b\x1b");
  expect_true(decoder.has_key(), "first ESC decoded");
  expect_true(decoder.pop().key == Key::Esc, "first ESC");
  decoder.flush();
  expect_true(decoder.pop().key == Key::Esc, "second ESC after flush");
}

void test_split_escape_sequence() {
  KeyDecoder decoder;
  decoder.feed("\x1b[1");
  expect_true(!decoder.has_key(), "incomplete CSI buffered");
  decoder.feed("5~");
  expect_true(decoder.pop().key == Key::F5, "sequence completed across reads");
}

void test_alt_and_control_chars() {
  auto keys = decode_all("\x1b" "b\x01\r\x7f\t");
  expect_eq(keys.size(), 5, "five keys");
  if (keys.size() == 5) {
    expect_true(keys[0].key == Key::Char && keys[0].ch == U'b' && keys[0].alt, "alt-b");
    expect_true(keys[1] == KeyInput::control(U'a'), "ctrl-a");
    expect_true(keys[2].key == Key::Enter, "carriage return is Enter");
    expect_true(keys[3].key == Key::Backspace, "DEL is Backspace");
    expect_true(keys[4].key == Key::Tab, "tab");
  }
}

void test_split_utf8() {
  KeyDecoder decoder;
  decoder.feed("\xe6\x9d");
  expect_true(!decoder.has_key(), "partial scalar buffered");
  decoder.feed("\xb1");
  KeyInput key = decoder.pop();
  expect_true(key.is_char(U'東'), "scalar decoded once complete");
}

void test_pop_on_empty() {
  KeyDecoder decoder;
  expect_true(decoder.pop().key == Key::Null, "empty decoder yields Null");
  decoder.feed("ab");
  expect_true(decoder.pop().is_char(U'a'), "first");
  expect_true(decoder.pop().is_char(U'b'), "second");
  expect_true(decoder.pop().key == Key::Null, "drained");
}

}  // namespace

void register_key_decoder_tests(std::vector<TestCase>& tests) {
  tests.push_back({"keys_arrow_keys", test_arrow_keys});
  tests.push_back({"keys_tilde_sequences", test_tilde_sequences});
  tests.push_back({"keys_modified_arrow", test_modified_arrow});
  tests.push_back({"keys_unknown_csi_consumed", test_unknown_csi_is_consumed});
  tests.push_back({"keys_long_csi_parameter", test_long_csi_parameter});
  tests.push_back({"keys_lone_escape_waits_for_flush", test_lone_escape_waits_for_flush});
  tests.push_back({"keys_double_escape", test_double_escape});
  tests.push_back({"keys_split_escape_sequence", test_split_escape_sequence});
  tests.push_back({"keys_alt_and_control_chars", test_alt_and_control_chars});
  tests.push_back({"keys_split_utf8", test_split_utf8});
  tests.push_back({"keys_pop_on_empty", test_pop_on_empty});
}
