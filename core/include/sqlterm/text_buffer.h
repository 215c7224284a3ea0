#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlterm {

/// Addresses a location in a TextBuffer as (line, scalar offset within the line).
/// MUST be compared lexicographically so selection ranges can be normalized.
struct Position {
  size_t row = 0;
  size_t col = 0;

  bool operator==(const Position& other) const { return row == other.row && col == other.col; }
  bool operator!=(const Position& other) const { return !(*this == other); }
  bool operator<(const Position& other) const {
    return row < other.row || (row == other.row && col < other.col);
  }
};

/// Cursor motions understood by TextBuffer::move_cursor.
enum class CursorMove {
  Back,
  Forward,
  Up,
  Down,
  WordForward,
  WordEnd,
  WordBack,
  Head,
  End,
  Top,
  Bottom,
};

/// Owns editable text as lines of Unicode scalars plus a cursor and an optional selection anchor.
/// MUST always hold at least one line and MUST keep the cursor within buffer bounds.
/// Inputs are motions/edits; outputs are text queries; side effects are limited to this object.
class TextBuffer {
 public:
  static constexpr size_t kDefaultMaxHistory = 50;

  /// Constructs an empty single-line buffer with a bounded undo history.
  /// MUST treat max_history == 0 as "history disabled".
  explicit TextBuffer(size_t max_history = kDefaultMaxHistory);

  /// Replaces the contents from UTF-8 text split on '\n'.
  /// MUST reset cursor to (0, 0), drop any selection and record an undo step.
  void set_text(const std::string& text);
  /// Returns the contents as UTF-8 with lines joined by '\n'.
  std::string text() const;
  /// Empties the buffer to a single blank line; records an undo step.
  void clear();

  size_t line_count() const { return lines_.size(); }
  /// Returns a line; MUST be called with row < line_count().
  const std::u32string& line(size_t row) const { return lines_[row]; }
  std::string line_utf8(size_t row) const;

  Position cursor() const { return cursor_; }
  /// Moves the cursor to pos after clamping it to buffer bounds.
  void set_cursor(Position pos);
  /// Applies a motion; motions that cannot move leave the cursor unchanged.
  void move_cursor(CursorMove move);

  /// Anchors a selection at the current cursor, replacing any previous anchor.
  void start_selection();
  void cancel_selection();
  bool has_selection() const { return anchor_.has_value(); }
  /// Returns the normalized half-open range [start, end) between anchor and cursor.
  /// MUST return nullopt when no selection is active.
  std::optional<std::pair<Position, Position>> selection_range() const;
  /// Orders anchor and cursor, then extends the later one by one scalar.
  /// MUST leave the scalars under both ends inside selection_range().
  void include_selection_end();

  /// Returns the selected text, moves the cursor to the range start and clears the selection.
  /// MUST return an empty string when no selection is active.
  std::u32string copy_selection();
  /// Removes the selected text, moves the cursor to the range start and clears the selection.
  /// MUST return the removed text and MUST be a no-op without a selection.
  std::u32string cut_selection();

  /// Inserts a scalar at the cursor; '\n' splits the line.
  void insert_char(char32_t c);
  /// Inserts text at the cursor, leaving the cursor after the inserted text.
  void insert_text(const std::u32string& text);
  void insert_newline();
  /// Deletes the scalar before the cursor, joining lines at column 0.
  bool delete_prev_char();
  /// Deletes the scalar under the cursor, joining lines at end of line.
  bool delete_next_char();
  /// Deletes from the cursor to the end of the line and returns the removed text.
  std::u32string delete_to_line_end();

  /// Records the current contents as an undo step and drops the redo chain.
  /// MUST be called before every mutation that should be undoable.
  void checkpoint();
  bool undo();
  bool redo();
  bool can_undo() const { return !undo_.empty(); }
  bool can_redo() const { return !redo_.empty(); }

 private:
  struct Snapshot {
    std::vector<std::u32string> lines;
    Position cursor;
  };

  void clamp_cursor();
  Position clamp(Position pos) const;
  std::u32string text_between(Position start, Position end) const;
  void erase_between(Position start, Position end);
  Snapshot snapshot() const;
  void restore(const Snapshot& snap);

  std::vector<std::u32string> lines_;
  Position cursor_;
  std::optional<Position> anchor_;
  std::vector<Snapshot> undo_;
  std::vector<Snapshot> redo_;
  size_t max_history_;
};

}  // namespace sqlterm
