#pragma once

#include <memory>
#include <optional>
#include <string>

#include "sqlterm/clipboard.h"
#include "sqlterm/key_input.h"
#include "sqlterm/text_buffer.h"

namespace sqlterm {

/// Editing modes of the query editor.
enum class Mode { Normal, Insert, Visual, OperatorPending };

/// Operator awaiting a motion while in Mode::OperatorPending.
enum class Operator { None, Yank, Delete, Change };

/// Maps an operator to its key letter ('y', 'd', 'c'), or 0 for None.
char operator_letter(Operator op);

/// Result of dispatching one key to the editor.
/// MUST carry the target mode for ModeChanged and the retained key for AwaitingOperand.
struct Transition {
  enum class Kind { NoChange, ModeChanged, AwaitingOperand };

  Kind kind = Kind::NoChange;
  Mode mode = Mode::Normal;
  Operator op = Operator::None;
  KeyInput pending;

  static Transition none() { return Transition{}; }
  static Transition to(Mode mode, Operator op = Operator::None) {
    Transition t;
    t.kind = Kind::ModeChanged;
    t.mode = mode;
    t.op = op;
    return t;
  }
  static Transition awaiting(const KeyInput& key) {
    Transition t;
    t.kind = Kind::AwaitingOperand;
    t.pending = key;
    return t;
  }
};

/// Vim-style modal editor over a TextBuffer used to compose SQL.
/// MUST treat every key as total input: unknown keys are no-ops and nothing throws.
/// Inputs are key presses; outputs are transitions; side effects are buffer edits
/// and best-effort clipboard writes on yank/cut.
class ModalEditor {
 public:
  /// Creates an empty editor in Normal mode.
  /// MUST accept a null clipboard, in which case yanks only fill the internal register.
  explicit ModalEditor(std::shared_ptr<Clipboard> clipboard = nullptr,
                       size_t max_history = TextBuffer::kDefaultMaxHistory);

  /// Interprets one key according to the current mode and applies the resulting transition.
  /// MUST keep the cursor within bounds and MUST retain unmatched keys for two-key commands.
  Transition handle_key(const KeyInput& input);

  /// Returns the buffer contents with lines joined by '\n'.
  std::string current_text() const { return buffer_.text(); }
  Position cursor() const { return buffer_.cursor(); }
  Mode mode() const { return mode_; }
  Operator pending_operator() const { return op_; }
  std::optional<KeyInput> pending_key() const { return pending_; }
  const TextBuffer& buffer() const { return buffer_; }
  std::optional<std::pair<Position, Position>> selection_range() const {
    return buffer_.selection_range();
  }
  /// Returns "NORMAL", "INSERT", "VISUAL" or "OPERATOR(<letter>)".
  std::string mode_label() const;
  /// Returns the text most recently yanked or cut, as UTF-8.
  std::string yank_register() const;

  /// Replaces the buffer contents; mode returns to Normal.
  void set_text(const std::string& text);
  /// Clears the buffer; this is the only implicit way the query text is discarded.
  void clear();

 private:
  Transition dispatch(const KeyInput& input);
  Transition dispatch_command(const KeyInput& input);
  Transition dispatch_insert(const KeyInput& input);
  bool apply_motion(const KeyInput& input);
  Transition apply_operator(Operator op);
  Transition finish_visual(Operator op);
  void begin_insert_edit();
  void store_yank(std::u32string text);

  TextBuffer buffer_;
  Mode mode_ = Mode::Normal;
  Operator op_ = Operator::None;
  std::optional<KeyInput> pending_;
  std::optional<KeyInput> next_pending_;
  std::u32string yank_;
  std::shared_ptr<Clipboard> clipboard_;
  bool insert_recorded_ = false;
};

}  // namespace sqlterm
