#include "sqlterm/text_buffer.h"

#include <algorithm>

#include "util/utf8.h"

namespace sqlterm {

namespace {

enum class CharKind { Space, Punct, Word };

CharKind char_kind(char32_t c) {
  if (c == U' ' || c == U'\t' || c == U'\r' || c == U'\v' || c == U'\f') {
    return CharKind::Space;
  }
  if ((c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || (c >= U'0' && c <= U'9') ||
      c == U'_' || c >= 0x80) {
    return CharKind::Word;
  }
  return CharKind::Punct;
}

bool is_word_end(const std::u32string& line, size_t i) {
  CharKind kind = char_kind(line[i]);
  if (kind == CharKind::Space) return false;
  return i + 1 == line.size() || char_kind(line[i + 1]) != kind;
}

bool is_word_start(const std::u32string& line, size_t i) {
  CharKind kind = char_kind(line[i]);
  if (kind == CharKind::Space) return false;
  return i == 0 || char_kind(line[i - 1]) != kind;
}

size_t first_non_space(const std::u32string& line) {
  size_t i = 0;
  while (i < line.size() && char_kind(line[i]) == CharKind::Space) ++i;
  return i < line.size() ? i : 0;
}

}  // namespace

TextBuffer::TextBuffer(size_t max_history) : lines_(1), max_history_(max_history) {}

void TextBuffer::set_text(const std::string& text) {
  checkpoint();
  lines_.clear();
  std::u32string all = util::utf8_to_u32(text);
  std::u32string current;
  for (char32_t c : all) {
    if (c == U'\n') {
      lines_.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  lines_.push_back(std::move(current));
  cursor_ = Position{};
  anchor_.reset();
}

std::string TextBuffer::text() const {
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += util::u32_to_utf8(lines_[i]);
  }
  return out;
}

void TextBuffer::clear() {
  checkpoint();
  lines_.assign(1, std::u32string());
  cursor_ = Position{};
  anchor_.reset();
}

std::string TextBuffer::line_utf8(size_t row) const {
  return util::u32_to_utf8(lines_[row]);
}

Position TextBuffer::clamp(Position pos) const {
  pos.row = std::min(pos.row, lines_.size() - 1);
  pos.col = std::min(pos.col, lines_[pos.row].size());
  return pos;
}

void TextBuffer::clamp_cursor() {
  cursor_ = clamp(cursor_);
}

void TextBuffer::set_cursor(Position pos) {
  cursor_ = clamp(pos);
}

void TextBuffer::move_cursor(CursorMove move) {
  const size_t last_row = lines_.size() - 1;
  const std::u32string& line = lines_[cursor_.row];
  switch (move) {
    case CursorMove::Back:
      if (cursor_.col > 0) {
        --cursor_.col;
      } else if (cursor_.row > 0) {
        --cursor_.row;
        cursor_.col = lines_[cursor_.row].size();
      }
      break;
    case CursorMove::Forward:
      if (cursor_.col < line.size()) {
        ++cursor_.col;
      } else if (cursor_.row < last_row) {
        ++cursor_.row;
        cursor_.col = 0;
      }
      break;
    case CursorMove::Up:
      if (cursor_.row > 0) {
        --cursor_.row;
        cursor_.col = std::min(cursor_.col, lines_[cursor_.row].size());
      }
      break;
    case CursorMove::Down:
      if (cursor_.row < last_row) {
        ++cursor_.row;
        cursor_.col = std::min(cursor_.col, lines_[cursor_.row].size());
      }
      break;
    case CursorMove::Head:
      cursor_.col = 0;
      break;
    case CursorMove::End:
      cursor_.col = line.size();
      break;
    case CursorMove::Top:
      cursor_.row = 0;
      cursor_.col = std::min(cursor_.col, lines_[0].size());
      break;
    case CursorMove::Bottom:
      cursor_.row = last_row;
      cursor_.col = std::min(cursor_.col, lines_[last_row].size());
      break;
    case CursorMove::WordForward: {
      size_t i = cursor_.col;
      if (i < line.size()) {
        CharKind kind = char_kind(line[i]);
        if (kind != CharKind::Space) {
          while (i < line.size() && char_kind(line[i]) == kind) ++i;
        }
      }
      while (i < line.size() && char_kind(line[i]) == CharKind::Space) ++i;
      if (i < line.size()) {
        cursor_.col = i;
      } else if (cursor_.row < last_row) {
        ++cursor_.row;
        cursor_.col = first_non_space(lines_[cursor_.row]);
      } else {
        cursor_.col = line.size();
      }
      break;
    }
    case CursorMove::WordEnd: {
      for (size_t i = cursor_.col + 1; i < line.size(); ++i) {
        if (is_word_end(line, i)) {
          cursor_.col = i;
          return;
        }
      }
      for (size_t row = cursor_.row + 1; row <= last_row; ++row) {
        const std::u32string& next = lines_[row];
        for (size_t i = 0; i < next.size(); ++i) {
          if (is_word_end(next, i)) {
            cursor_ = Position{row, i};
            return;
          }
        }
      }
      cursor_.col = line.size();
      break;
    }
    case CursorMove::WordBack: {
      for (size_t i = std::min(cursor_.col, line.size()); i > 0; --i) {
        if (is_word_start(line, i - 1)) {
          cursor_.col = i - 1;
          return;
        }
      }
      for (size_t row = cursor_.row; row > 0; --row) {
        const std::u32string& prev = lines_[row - 1];
        if (prev.empty()) {
          cursor_ = Position{row - 1, 0};
          return;
        }
        for (size_t i = prev.size(); i > 0; --i) {
          if (is_word_start(prev, i - 1)) {
            cursor_ = Position{row - 1, i - 1};
            return;
          }
        }
      }
      cursor_ = Position{};
      break;
    }
  }
}

void TextBuffer::start_selection() {
  anchor_ = cursor_;
}

void TextBuffer::cancel_selection() {
  anchor_.reset();
}

std::optional<std::pair<Position, Position>> TextBuffer::selection_range() const {
  if (!anchor_) return std::nullopt;
  Position a = clamp(*anchor_);
  Position b = cursor_;
  if (b < a) std::swap(a, b);
  return std::make_pair(a, b);
}

void TextBuffer::include_selection_end() {
  if (!anchor_) return;
  Position start = clamp(*anchor_);
  Position end = cursor_;
  if (end < start) std::swap(start, end);
  anchor_ = start;
  cursor_ = end;
  move_cursor(CursorMove::Forward);
}

std::u32string TextBuffer::text_between(Position start, Position end) const {
  if (start.row == end.row) {
    return lines_[start.row].substr(start.col, end.col - start.col);
  }
  std::u32string out = lines_[start.row].substr(start.col);
  for (size_t row = start.row + 1; row < end.row; ++row) {
    out.push_back(U'\n');
    out += lines_[row];
  }
  out.push_back(U'\n');
  out += lines_[end.row].substr(0, end.col);
  return out;
}

void TextBuffer::erase_between(Position start, Position end) {
  std::u32string tail = lines_[end.row].substr(end.col);
  lines_[start.row].resize(start.col);
  lines_[start.row] += tail;
  if (end.row > start.row) {
    lines_.erase(lines_.begin() + static_cast<long>(start.row) + 1,
                 lines_.begin() + static_cast<long>(end.row) + 1);
  }
  cursor_ = start;
}

std::u32string TextBuffer::copy_selection() {
  auto range = selection_range();
  if (!range) return {};
  std::u32string out = text_between(range->first, range->second);
  cursor_ = range->first;
  anchor_.reset();
  return out;
}

std::u32string TextBuffer::cut_selection() {
  auto range = selection_range();
  if (!range) return {};
  std::u32string out = text_between(range->first, range->second);
  erase_between(range->first, range->second);
  anchor_.reset();
  return out;
}

void TextBuffer::insert_char(char32_t c) {
  if (c == U'\n') {
    insert_newline();
    return;
  }
  std::u32string& line = lines_[cursor_.row];
  line.insert(line.begin() + static_cast<long>(cursor_.col), c);
  ++cursor_.col;
}

void TextBuffer::insert_text(const std::u32string& text) {
  for (char32_t c : text) {
    insert_char(c);
  }
}

void TextBuffer::insert_newline() {
  std::u32string& line = lines_[cursor_.row];
  std::u32string tail = line.substr(cursor_.col);
  line.resize(cursor_.col);
  lines_.insert(lines_.begin() + static_cast<long>(cursor_.row) + 1, std::move(tail));
  ++cursor_.row;
  cursor_.col = 0;
}

bool TextBuffer::delete_prev_char() {
  if (cursor_.col > 0) {
    std::u32string& line = lines_[cursor_.row];
    line.erase(cursor_.col - 1, 1);
    --cursor_.col;
    return true;
  }
  if (cursor_.row == 0) return false;
  size_t prev_len = lines_[cursor_.row - 1].size();
  lines_[cursor_.row - 1] += lines_[cursor_.row];
  lines_.erase(lines_.begin() + static_cast<long>(cursor_.row));
  --cursor_.row;
  cursor_.col = prev_len;
  return true;
}

bool TextBuffer::delete_next_char() {
  std::u32string& line = lines_[cursor_.row];
  if (cursor_.col < line.size()) {
    line.erase(cursor_.col, 1);
    return true;
  }
  if (cursor_.row + 1 >= lines_.size()) return false;
  line += lines_[cursor_.row + 1];
  lines_.erase(lines_.begin() + static_cast<long>(cursor_.row) + 1);
  return true;
}

std::u32string TextBuffer::delete_to_line_end() {
  std::u32string& line = lines_[cursor_.row];
  std::u32string removed = line.substr(cursor_.col);
  line.resize(cursor_.col);
  return removed;
}

TextBuffer::Snapshot TextBuffer::snapshot() const {
  return Snapshot{lines_, cursor_};
}

void TextBuffer::restore(const Snapshot& snap) {
  lines_ = snap.lines;
  cursor_ = snap.cursor;
  anchor_.reset();
  if (lines_.empty()) lines_.emplace_back();
  clamp_cursor();
}

void TextBuffer::checkpoint() {
  if (max_history_ == 0) return;
  undo_.push_back(snapshot());
  if (undo_.size() > max_history_) {
    undo_.erase(undo_.begin());
  }
  redo_.clear();
}

bool TextBuffer::undo() {
  if (undo_.empty()) return false;
  redo_.push_back(snapshot());
  restore(undo_.back());
  undo_.pop_back();
  return true;
}

bool TextBuffer::redo() {
  if (redo_.empty()) return false;
  undo_.push_back(snapshot());
  restore(redo_.back());
  redo_.pop_back();
  return true;
}

}  // namespace sqlterm
