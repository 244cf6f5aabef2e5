#include "editor.hpp"
#include <algorithm>
#include <cstdio>
#include "file_io.hpp"
#include "utf8.hpp"

void Editor::ensure_backup() {
  if (backup_done_) return;
  if (!file_existed_) { backup_done_ = true; return; }
  std::string msg;
  if (copy_file_bytes(path_, backup_path(), msg) != Status::Ok) { set_status("Backup failed: " + msg); return; }
  backup_done_ = true;
}

void Editor::after_change(bool count_words) {
  modified_ = true;
  search_.refresh(buf_);
  if (count_words) stats_.observe(buf_.word_count(), today());
  else stats_.rebase(buf_.word_count());
}

void Editor::commit_edit(EditClass kind, Delta d, size_t cursor_before, size_t cursor_after) {
  undo_.record(kind, std::move(d), cursor_before, cursor_after, now());
  cur_.offset = cursor_after;
  cur_.sticky_col = buf_.offset_to_line_col(cursor_after).col;
  after_change(true);
}

void Editor::insert_text(const std::string& text) {
  ensure_backup();
  size_t at = std::min(cur_.offset, buf_.length());
  Delta d;
  d.offset = at;
  d.inserted = buf_.insert(at, text);
  commit_edit(EditClass::Insert, std::move(d), at, at + utf8_length(text));
}

void Editor::backspace() {
  size_t at = std::min(cur_.offset, buf_.length());
  if (at == 0) return;
  ensure_backup();
  Delta d;
  d.offset = at - 1;
  d.removed = buf_.erase({at - 1, at});
  commit_edit(EditClass::Delete, std::move(d), at, at - 1);
}

void Editor::delete_forward() {
  size_t at = std::min(cur_.offset, buf_.length());
  if (at >= buf_.length()) return;
  ensure_backup();
  Delta d;
  d.offset = at;
  d.removed = buf_.erase({at, at + 1});
  commit_edit(EditClass::Delete, std::move(d), at, at);
}

void Editor::delete_line() {
  size_t line = buf_.offset_to_line_col(std::min(cur_.offset, buf_.length())).line;
  size_t count = buf_.line_count();
  Range lr = buf_.line_range(line);
  Range del = lr;
  if (line + 1 < count) del.end = lr.end + 1;       /* line plus its newline; the last line keeps its slot */
  register_ = buf_.slice(lr);
  if (del.size() == 0) return;
  ensure_backup();
  undo_.close_group();
  size_t before = cur_.offset;
  Delta d;
  d.offset = del.start;
  d.removed = buf_.erase(del);
  size_t target = std::min(line, buf_.line_count() - 1);
  size_t after = buf_.line_range(target).start;
  commit_edit(EditClass::Delete, std::move(d), before, after);
  undo_.close_group();
  set_status("Line deleted");
}

void Editor::yank_line() {
  size_t line = buf_.offset_to_line_col(std::min(cur_.offset, buf_.length())).line;
  register_ = buf_.line(line);
  set_status("Line copied");
}

void Editor::paste_below() {
  if (!register_) { set_status("Nothing to paste"); return; }
  ensure_backup();
  undo_.close_group();
  size_t line = buf_.offset_to_line_col(std::min(cur_.offset, buf_.length())).line;
  size_t at = buf_.line_range(line).end;
  size_t before = cur_.offset;
  Delta d;
  d.offset = at;
  d.inserted = buf_.insert(at, "\n" + *register_);
  commit_edit(EditClass::Insert, std::move(d), before, at + 1);
  undo_.close_group();
  clamp_cursor(buf_, cur_, navigate_cursor());
}

void Editor::undo() {
  size_t off = cur_.offset;
  Status st = undo_.undo(buf_, off);
  if (st != Status::Ok) { set_status("Nothing to undo"); return; }
  set_cursor(buf_, cur_, off, navigate_cursor());
  after_change(false);
  set_status("Undo");
}

void Editor::redo() {
  size_t off = cur_.offset;
  Status st = undo_.redo(buf_, off);
  if (st != Status::Ok) { set_status("Nothing to redo"); return; }
  set_cursor(buf_, cur_, off, navigate_cursor());
  after_change(false);
  set_status("Redo");
}

void Editor::request_quit() {
  if (modified_) {
    input_.reset();
    quit_prompt_ = true;
    return;
  }
  should_quit_ = true;
}

Status Editor::save(bool manual) {
  if (manual) undo_.close_group();
  std::string msg;
  if (buf_.write_file(path_, msg) != Status::Ok) {
    set_status((manual ? "Save failed: " : "Autosave failed: ") + msg);
    return Status::IoError;
  }
  modified_ = false;
  file_existed_ = true;
  last_autosave_ = now();
  set_status(manual ? "Saved" : "Autosaved");

  if (!stats_file_.empty() && stats_.save(stats_file_, msg) != Status::Ok) set_status("Saved; stats not saved: " + msg);
  if (versions_) {
    std::string text = buf_.text();
    bool want = manual || (cfg_.version_on_autosave && versions_->content_differs(path_, text));
    if (want && versions_->record(path_, text, msg) != Status::Ok) set_status("Saved; version not recorded: " + msg);
  }
  return Status::Ok;
}

void Editor::run_search(const std::string& query) {
  if (query.empty()) { search_.clear(); return; }
  size_t from = std::min(cur_.offset, buf_.length()) + 1;
  Status st = search_.execute(buf_, query, from);
  if (st == Status::NoMatches) { set_status("No matches for \"" + query + "\""); return; }
  const Range& m = search_.matches()[static_cast<size_t>(search_.current())];
  set_cursor(buf_, cur_, m.start, true);
  set_status("Match " + std::to_string(search_.current() + 1) + "/" + std::to_string(search_.matches().size()));
}

void Editor::search_step(bool forward) {
  size_t off = cur_.offset;
  Status st = forward ? search_.next(off) : search_.previous(off);
  if (st != Status::Ok) { set_status("No matches"); return; }
  set_cursor(buf_, cur_, off, true);
  set_status("Match " + std::to_string(search_.current() + 1) + "/" + std::to_string(search_.matches().size()));
}

void Editor::load_history(OverlayState& o) {
  o.records.clear();
  o.previews.clear();
  if (!versions_) return;
  std::string msg;
  std::vector<VersionRecord> recs;
  if (versions_->records(path_, recs, msg) != Status::Ok) { set_status("History unavailable: " + msg); return; }
  std::reverse(recs.begin(), recs.end());
  for (const VersionRecord& r : recs) {
    std::string content;
    Status st = versions_->load(path_, r.timestamp_ms, content, msg);
    if (st == Status::VersionRecordCorrupt) continue;
    o.records.push_back(r);
    o.previews.push_back(st == Status::Ok ? version_preview(content) : "(unreadable)");
  }
}

void Editor::show_version(OverlayState& o, bool as_diff) {
  std::string content, msg;
  const VersionRecord& r = o.records[o.selection];
  if (versions_->load(path_, r.timestamp_ms, content, msg) != Status::Ok) { set_status(msg); return; }
  o.lines = as_diff ? format_diff(diff_lines(content, buf_.text())) : split_lines(content);
  if (o.lines.empty()) o.lines.push_back(as_diff ? "(no differences)" : "(empty)");
  o.view = as_diff ? HistoryView::Diff : HistoryView::Content;
  o.scroll = 0;
}

void Editor::restore_version(OverlayState& o) {
  std::string msg;
  int64_t ts = o.records[o.selection].timestamp_ms;
  ensure_backup();
  Status st = versions_->restore(path_, ts, buf_, undo_, msg);
  if (st != Status::Ok) { set_status("Restore failed: " + msg); return; }
  after_change(false);
  enter_navigate();
  set_cursor(buf_, cur_, cur_.offset, true);
  set_status(msg);
}

std::vector<std::string> Editor::help_lines() const {
  return {
    "NAVIGATION",
    "  Arrow keys       Move cursor",
    "  Ctrl+Left/Right  Move by word",
    "  Home/End         Line start/end",
    "  Ctrl+Home/End    Document start/end",
    "  PageUp/PageDown  Move by page",
    "",
    "NAVIGATE MODE (Escape to enter)",
    "  h/j/k/l          Left/down/up/right",
    "  w/b              Next/previous word",
    "  {/}              Previous/next paragraph",
    "  0/$              Line start/end",
    "  gg/G             Document start/end",
    "  /                Search",
    "  n/N              Next/previous match",
    "",
    "EDITING (Navigate mode)",
    "  dd               Delete line",
    "  yy               Copy line",
    "  p                Paste line below",
    "  u / Ctrl+R       Undo / redo",
    "  i                Return to writing",
    "  s / v            Stats / version history",
    "",
    "GENERAL",
    "  Ctrl+S           Save",
    "  Ctrl+Q           Quit",
    "  Ctrl+G           Toggle status bar",
    "  Ctrl+Z / Ctrl+Y  Undo / redo",
    "  ?                Show this help",
  };
}

std::vector<std::string> Editor::stats_lines() const {
  std::vector<std::string> out;
  Date d = today();
  size_t today_words = stats_.total_for(d);
  out.push_back("Document:  " + std::to_string(buf_.word_count()) + " words");
  out.push_back("Today:     " + std::to_string(today_words) + " words");
  GoalProgress p = stats_.progress(d);
  if (p.enabled) {
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%.0f%%", p.raw_ratio * 100.0);
    out.push_back("Goal:      " + std::to_string(stats_.goal()) + " words (" + pct + ")");
    if (p.exceeded) out.push_back("           goal exceeded");
    out.push_back("Streak:    " + std::to_string(stats_.streak(d)) + " days");
  } else {
    out.push_back("Goal:      not set");
  }
  out.push_back("Session:   " + std::to_string(stats_.session_words_written()) + " words in " +
                format_elapsed(stats_.session_elapsed(now())));
  return out;
}

std::string Editor::status_bar_text() const {
  std::string s = "Words: " + std::to_string(buf_.word_count()) + "  |  " +
                  format_elapsed(stats_.session_elapsed(now())) + "  |  " + mode_label(mode()) +
                  (modified_ ? " [+]" : "");
  Date d = today();
  GoalProgress p = stats_.progress(d);
  if (p.enabled && cfg_.show_progress) {
    s += "  |  Goal " + std::to_string(static_cast<int>(p.ratio * 100.0)) + "%";
    if (p.exceeded) s += "+";
  }
  if (p.enabled && cfg_.show_streak) s += "  |  Streak " + std::to_string(stats_.streak(d));
  return s;
}
