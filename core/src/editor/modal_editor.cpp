#include "sqlterm/modal_editor.h"

#include "util/utf8.h"

namespace sqlterm {

namespace {

Operator operator_for(const KeyInput& input) {
  if (input.is_char(U'y')) return Operator::Yank;
  if (input.is_char(U'd')) return Operator::Delete;
  if (input.is_char(U'c')) return Operator::Change;
  return Operator::None;
}

}  // namespace

char operator_letter(Operator op) {
  switch (op) {
    case Operator::Yank:
      return 'y';
    case Operator::Delete:
      return 'd';
    case Operator::Change:
      return 'c';
    case Operator::None:
      break;
  }
  return 0;
}

ModalEditor::ModalEditor(std::shared_ptr<Clipboard> clipboard, size_t max_history)
    : buffer_(max_history), clipboard_(std::move(clipboard)) {}

Transition ModalEditor::handle_key(const KeyInput& input) {
  next_pending_.reset();
  Transition t = dispatch(input);
  switch (t.kind) {
    case Transition::Kind::ModeChanged:
      mode_ = t.mode;
      op_ = t.op;
      if (mode_ == Mode::Normal || mode_ == Mode::Insert) {
        buffer_.cancel_selection();
      }
      break;
    case Transition::Kind::AwaitingOperand:
      next_pending_ = t.pending;
      break;
    case Transition::Kind::NoChange:
      break;
  }
  pending_ = next_pending_;
  return t;
}

Transition ModalEditor::dispatch(const KeyInput& input) {
  if (input.key == Key::Null) {
    next_pending_ = pending_;
    return Transition::none();
  }
  if (mode_ == Mode::Insert) {
    return dispatch_insert(input);
  }
  return dispatch_command(input);
}

bool ModalEditor::apply_motion(const KeyInput& input) {
  if (input.is_char(U'h') || input.key == Key::Left) {
    buffer_.move_cursor(CursorMove::Back);
  } else if (input.is_char(U'j') || input.key == Key::Down) {
    buffer_.move_cursor(CursorMove::Down);
  } else if (input.is_char(U'k') || input.key == Key::Up) {
    buffer_.move_cursor(CursorMove::Up);
  } else if (input.is_char(U'l') || input.key == Key::Right) {
    buffer_.move_cursor(CursorMove::Forward);
  } else if (input.is_char(U'w')) {
    buffer_.move_cursor(CursorMove::WordForward);
  } else if (input.is_char(U'e')) {
    buffer_.move_cursor(CursorMove::WordEnd);
    if (mode_ == Mode::OperatorPending) {
      // e is inclusive when it defines an operand.
      buffer_.move_cursor(CursorMove::Forward);
    }
  } else if (input.is_char(U'b')) {
    buffer_.move_cursor(CursorMove::WordBack);
  } else if (input.is_char(U'^') || input.key == Key::Home) {
    buffer_.move_cursor(CursorMove::Head);
  } else if (input.is_char(U'$') || input.key == Key::End) {
    buffer_.move_cursor(CursorMove::End);
  } else if (input.is_char(U'G')) {
    buffer_.move_cursor(CursorMove::Bottom);
  } else if (input.is_char(U'g') && pending_ && pending_->is_char(U'g')) {
    buffer_.move_cursor(CursorMove::Top);
  } else {
    return false;
  }
  return true;
}

Transition ModalEditor::dispatch_command(const KeyInput& input) {
  if (apply_motion(input)) {
    if (mode_ == Mode::OperatorPending) {
      return apply_operator(op_);
    }
    return Transition::none();
  }

  if (input.is_char(U'D') || input.is_char(U'C')) {
    buffer_.cancel_selection();
    buffer_.checkpoint();
    store_yank(buffer_.delete_to_line_end());
    if (input.is_char(U'C')) {
      insert_recorded_ = true;
      return Transition::to(Mode::Insert);
    }
    return Transition::to(Mode::Normal);
  }
  if (input.is_char(U'p')) {
    buffer_.cancel_selection();
    if (!yank_.empty()) {
      buffer_.checkpoint();
      buffer_.insert_text(yank_);
    }
    return Transition::to(Mode::Normal);
  }
  if (input.is_char(U'u')) {
    buffer_.undo();
    return Transition::to(Mode::Normal);
  }
  if (input.is_ctrl(U'r')) {
    buffer_.redo();
    return Transition::to(Mode::Normal);
  }
  if (input.is_char(U'x')) {
    buffer_.cancel_selection();
    Position pos = buffer_.cursor();
    if (pos.col < buffer_.line(pos.row).size()) {
      buffer_.checkpoint();
      buffer_.delete_next_char();
    }
    return Transition::to(Mode::Normal);
  }

  if (mode_ == Mode::Normal) {
    if (input.is_char(U'i')) {
      insert_recorded_ = false;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'a')) {
      Position pos = buffer_.cursor();
      if (pos.col < buffer_.line(pos.row).size()) {
        buffer_.move_cursor(CursorMove::Forward);
      }
      insert_recorded_ = false;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'A')) {
      buffer_.move_cursor(CursorMove::End);
      insert_recorded_ = false;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'I')) {
      buffer_.move_cursor(CursorMove::Head);
      insert_recorded_ = false;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'o')) {
      buffer_.checkpoint();
      buffer_.move_cursor(CursorMove::End);
      buffer_.insert_newline();
      insert_recorded_ = true;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'O')) {
      buffer_.checkpoint();
      buffer_.move_cursor(CursorMove::Head);
      buffer_.insert_newline();
      buffer_.move_cursor(CursorMove::Up);
      insert_recorded_ = true;
      return Transition::to(Mode::Insert);
    }
    if (input.is_char(U'v')) {
      buffer_.start_selection();
      return Transition::to(Mode::Visual);
    }
    if (input.is_char(U'V')) {
      buffer_.move_cursor(CursorMove::Head);
      buffer_.start_selection();
      buffer_.move_cursor(CursorMove::End);
      return Transition::to(Mode::Visual);
    }
    if (input.key == Key::Esc) {
      return Transition::none();
    }
    Operator op = operator_for(input);
    if (op != Operator::None) {
      buffer_.start_selection();
      next_pending_ = input;
      return Transition::to(Mode::OperatorPending, op);
    }
    return Transition::awaiting(input);
  }

  if (mode_ == Mode::Visual) {
    if (input.key == Key::Esc || input.is_char(U'v')) {
      return Transition::to(Mode::Normal);
    }
    Operator op = operator_for(input);
    if (op != Operator::None) {
      return finish_visual(op);
    }
    return Transition::awaiting(input);
  }

  // OperatorPending
  if (input.key == Key::Esc) {
    return Transition::to(Mode::Normal);
  }
  if (operator_for(input) == op_ && pending_ && *pending_ == input) {
    // Doubled operator: the operand is the whole current line.
    buffer_.move_cursor(CursorMove::Head);
    buffer_.start_selection();
    Position before = buffer_.cursor();
    buffer_.move_cursor(CursorMove::Down);
    if (buffer_.cursor() == before) {
      buffer_.move_cursor(CursorMove::End);
    }
    return apply_operator(op_);
  }
  return Transition::awaiting(input);
}

Transition ModalEditor::apply_operator(Operator op) {
  auto range = buffer_.selection_range();
  bool empty = !range || range->first == range->second;
  switch (op) {
    case Operator::Yank:
      if (!empty) {
        store_yank(buffer_.copy_selection());
      }
      return Transition::to(Mode::Normal);
    case Operator::Delete:
      if (!empty) {
        buffer_.checkpoint();
        store_yank(buffer_.cut_selection());
      }
      return Transition::to(Mode::Normal);
    case Operator::Change:
      if (!empty) {
        buffer_.checkpoint();
        store_yank(buffer_.cut_selection());
        insert_recorded_ = true;
      } else {
        insert_recorded_ = false;
      }
      return Transition::to(Mode::Insert);
    case Operator::None:
      break;
  }
  return Transition::to(Mode::Normal);
}

Transition ModalEditor::finish_visual(Operator op) {
  buffer_.include_selection_end();
  return apply_operator(op);
}

Transition ModalEditor::dispatch_insert(const KeyInput& input) {
  if (input.key == Key::Esc || input.is_ctrl(U'c')) {
    return Transition::to(Mode::Normal);
  }
  switch (input.key) {
    case Key::Char:
      if (input.ctrl || input.alt) {
        return Transition::none();
      }
      begin_insert_edit();
      buffer_.insert_char(input.ch);
      break;
    case Key::Enter:
      begin_insert_edit();
      buffer_.insert_newline();
      break;
    case Key::Tab:
      begin_insert_edit();
      buffer_.insert_char(U'\t');
      break;
    case Key::Backspace: {
      Position pos = buffer_.cursor();
      if (pos.row > 0 || pos.col > 0) {
        begin_insert_edit();
        buffer_.delete_prev_char();
      }
      break;
    }
    case Key::Delete: {
      Position pos = buffer_.cursor();
      if (pos.col < buffer_.line(pos.row).size() || pos.row + 1 < buffer_.line_count()) {
        begin_insert_edit();
        buffer_.delete_next_char();
      }
      break;
    }
    case Key::Left:
      buffer_.move_cursor(CursorMove::Back);
      break;
    case Key::Right:
      buffer_.move_cursor(CursorMove::Forward);
      break;
    case Key::Up:
      buffer_.move_cursor(CursorMove::Up);
      break;
    case Key::Down:
      buffer_.move_cursor(CursorMove::Down);
      break;
    case Key::Home:
      buffer_.move_cursor(CursorMove::Head);
      break;
    case Key::End:
      buffer_.move_cursor(CursorMove::End);
      break;
    default:
      break;
  }
  return Transition::none();
}

void ModalEditor::begin_insert_edit() {
  if (!insert_recorded_) {
    buffer_.checkpoint();
    insert_recorded_ = true;
  }
}

void ModalEditor::store_yank(std::u32string text) {
  yank_ = std::move(text);
  copy_to_clipboard(clipboard_.get(), util::u32_to_utf8(yank_));
}

std::string ModalEditor::mode_label() const {
  switch (mode_) {
    case Mode::Normal:
      return "NORMAL";
    case Mode::Insert:
      return "INSERT";
    case Mode::Visual:
      return "VISUAL";
    case Mode::OperatorPending:
      return std::string("OPERATOR(") + operator_letter(op_) + ")";
  }
  return "NORMAL";
}

std::string ModalEditor::yank_register() const {
  return util::u32_to_utf8(yank_);
}

void ModalEditor::set_text(const std::string& text) {
  buffer_.set_text(text);
  mode_ = Mode::Normal;
  op_ = Operator::None;
  pending_.reset();
}

void ModalEditor::clear() {
  buffer_.clear();
  mode_ = Mode::Normal;
  op_ = Operator::None;
  pending_.reset();
}

}  // namespace sqlterm
