#pragma once
/*
 * UndoManager
 *
 * Purpose: time-windowed grouping of buffer deltas into undoable steps.
 * Grouping: an edit extends the open group iff it has the same class, starts
 * where the previous edit left the cursor, and arrives within the window.
 * Deltas are plain data; undo/redo re-derive the buffer ops from them.
 */
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "text_buffer.hpp"
#include "types.hpp"

enum class EditClass { Insert, Delete };

struct Delta {
  size_t offset = 0;
  std::string removed;  /* text that was at [offset, offset+len(removed)) before */
  std::string inserted; /* text that is at [offset, offset+len(inserted)) after */
};

struct UndoGroup {
  using Clock = std::chrono::steady_clock;
  EditClass kind = EditClass::Insert;
  std::vector<Delta> deltas;
  size_t cursor_before = 0;
  size_t cursor_after = 0;
  Clock::time_point created{};
  Clock::time_point last_edit{};
};

class UndoManager {
public:
  using Clock = std::chrono::steady_clock;

  explicit UndoManager(std::chrono::milliseconds window = std::chrono::milliseconds(2000)) : window_(window) {}

  /* record one applied edit; clears the redo stack */
  void record(EditClass kind, Delta delta, size_t cursor_before, size_t cursor_after, Clock::time_point now);
  /* push the open group, if any, onto the undo stack */
  void close_group();

  Status undo(TextBuffer& buf, size_t& cursor);
  Status redo(TextBuffer& buf, size_t& cursor);
  void clear();

  bool can_undo() const { return open_.has_value() || !undo_.empty(); }
  bool can_redo() const { return !redo_.empty(); }
  bool has_open_group() const { return open_.has_value(); }
  size_t undo_size() const { return undo_.size() + (open_ ? 1 : 0); }
  size_t redo_size() const { return redo_.size(); }

private:
  std::chrono::milliseconds window_;
  std::optional<UndoGroup> open_;
  std::vector<UndoGroup> undo_;
  std::vector<UndoGroup> redo_;
};
