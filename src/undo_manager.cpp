#include "undo_manager.hpp"
#include "utf8.hpp"

void UndoManager::record(EditClass kind, Delta delta, size_t cursor_before, size_t cursor_after, Clock::time_point now) {
  redo_.clear();
  bool extend = open_ && open_->kind == kind && open_->cursor_after == cursor_before &&
                now >= open_->last_edit && now - open_->last_edit <= window_;
  if (!extend) {
    close_group();
    UndoGroup g;
    g.kind = kind;
    g.cursor_before = cursor_before;
    g.created = now;
    open_ = std::move(g);
  }
  open_->deltas.push_back(std::move(delta));
  open_->cursor_after = cursor_after;
  open_->last_edit = now;
}

void UndoManager::close_group() {
  if (!open_) return;
  if (!open_->deltas.empty()) undo_.push_back(std::move(*open_));
  open_.reset();
}

Status UndoManager::undo(TextBuffer& buf, size_t& cursor) {
  close_group();
  if (undo_.empty()) return Status::NothingToUndo;
  UndoGroup g = std::move(undo_.back());
  undo_.pop_back();
  for (auto it = g.deltas.rbegin(); it != g.deltas.rend(); ++it) {
    size_t n = utf8_length(it->inserted);
    buf.erase({it->offset, it->offset + n});
    buf.insert(it->offset, it->removed);
  }
  cursor = g.cursor_before;
  redo_.push_back(std::move(g));
  return Status::Ok;
}

Status UndoManager::redo(TextBuffer& buf, size_t& cursor) {
  close_group();
  if (redo_.empty()) return Status::NothingToRedo;
  UndoGroup g = std::move(redo_.back());
  redo_.pop_back();
  for (const Delta& d : g.deltas) {
    size_t n = utf8_length(d.removed);
    buf.erase({d.offset, d.offset + n});
    buf.insert(d.offset, d.inserted);
  }
  cursor = g.cursor_after;
  undo_.push_back(std::move(g));
  return Status::Ok;
}

void UndoManager::clear() {
  open_.reset();
  undo_.clear();
  redo_.clear();
}
