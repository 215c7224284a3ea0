#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sqlterm/key_input.h"

namespace sqlterm::cli {

/// Decodes raw terminal bytes into key presses.
/// MUST consume only complete sequences; an incomplete escape or UTF-8 sequence at the end
/// stays in bytes unless flush is true, in which case a lone ESC decodes to Key::Esc.
/// Returns the number of bytes consumed.
size_t decode_keys(const std::string& bytes, std::vector<KeyInput>& out, bool flush);

/// Buffers partial input across reads and hands out decoded keys in order.
class KeyDecoder {
 public:
  void feed(const std::string& bytes);
  /// Resolves anything still buffered, such as a lone ESC after an idle tick.
  void flush();
  bool has_key() const { return next_ < keys_.size(); }
  /// Returns the next decoded key, or a Key::Null input when none is queued.
  KeyInput pop();

 private:
  void compact();

  std::string pending_;
  std::vector<KeyInput> keys_;
  size_t next_ = 0;
};

}  // namespace sqlterm::cli
