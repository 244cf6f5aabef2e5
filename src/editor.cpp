#include "editor.hpp"
#include <algorithm>
#include "renderer.hpp"
#include "utf8.hpp"

const char* mode_label(ModeKind m) {
  switch (m) {
    case ModeKind::Write: return "WRITE";
    case ModeKind::Navigate: return "NAV";
    case ModeKind::Search: return "SEARCH";
    case ModeKind::Help: return "HELP";
    case ModeKind::Stats: return "STATS";
    case ModeKind::History: return "HISTORY";
  }
  return "";
}

Editor::Editor(Config cfg, std::filesystem::path file, ClockFn clock, WallClockFn wall)
  : cfg_(std::move(cfg)), path_(std::move(file)), clock_(std::move(clock)), wall_(std::move(wall)),
    undo_(std::chrono::milliseconds(SCRIBE_UNDO_GROUP_WINDOW_MS)), stats_(cfg_.daily_goal) {
  if (!clock_) clock_ = [] { return Clock::now(); };
  if (!wall_) wall_ = [] { return std::chrono::system_clock::now(); };
  show_status_ = cfg_.show_status;
  if (cfg_.versions_enabled && !cfg_.data_dir.empty()) {
    auto wall_fn = wall_;
    versions_ = std::make_unique<VersionStore>(cfg_.data_dir / "versions", static_cast<size_t>(cfg_.max_versions),
      [wall_fn] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(wall_fn().time_since_epoch()).count();
      });
  }
  if (!cfg_.data_dir.empty()) stats_file_ = cfg_.data_dir / "stats.txt";
}

Status Editor::open(std::string& msg) {
  std::error_code ec;
  file_existed_ = std::filesystem::exists(path_, ec);
  if (file_existed_) {
    if (buf_.load_file(path_, msg) != Status::Ok) return Status::IoError;
    msg = "Opened " + path_.filename().string();
  } else {
    msg = "New file " + path_.filename().string();
  }
  set_status(msg);
  if (!stats_file_.empty()) {
    std::string m;
    if (stats_.load(stats_file_, m) != Status::Ok) set_status("Stats not loaded: " + m);
  }
  stats_.begin_session(buf_.word_count(), now());
  last_autosave_ = now();
  drain_warnings();
  return Status::Ok;
}

std::filesystem::path Editor::backup_path() const {
  std::filesystem::path p = path_;
  p += SCRIBE_BACKUP_SUFFIX;
  return p;
}

ModeKind Editor::mode() const {
  if (std::holds_alternative<WriteState>(state_)) return ModeKind::Write;
  if (std::holds_alternative<NavigateState>(state_)) return ModeKind::Navigate;
  if (std::holds_alternative<SearchState>(state_)) return ModeKind::Search;
  return std::get<OverlayState>(state_).kind;
}

bool Editor::navigate_cursor() const { return !std::holds_alternative<WriteState>(state_); }

void Editor::set_status(const std::string& msg) {
  status_ = msg;
  status_time_ = now();
}

void Editor::drain_warnings() {
  std::vector<std::string> w = stats_.take_warnings();
  if (versions_) {
    auto v = versions_->take_warnings();
    w.insert(w.end(), v.begin(), v.end());
  }
  if (!w.empty()) set_status("warning: " + w.back());
}

void Editor::handle_key(const KeyEvent& k) {
  if (quit_prompt_) {
    handle_quit_prompt(k);
  } else if (!handle_universal(k)) {
    if (std::holds_alternative<WriteState>(state_)) handle_write(k);
    else if (std::holds_alternative<NavigateState>(state_)) handle_navigate(k);
    else if (auto* s = std::get_if<SearchState>(&state_)) handle_search(*s, k);
    else handle_overlay(std::get<OverlayState>(state_), k);
  }
  drain_warnings();
}

bool Editor::handle_universal(const KeyEvent& k) {
  if (k.code != Key::Char || !k.ctrl) return false;
  if (k.ch == U's' || k.ch == U'q' || k.ch == U'g' || k.ch == U'z' || k.ch == U'y') input_.reset();
  switch (k.ch) {
    case U's': save(true); return true;
    case U'q': request_quit(); return true;
    case U'g':
      show_status_ = !show_status_;
      set_status(show_status_ ? "Status bar on" : "Status bar off");
      return true;
    case U'z': undo(); return true;
    case U'y': redo(); return true;
    default: return false;
  }
}

void Editor::handle_quit_prompt(const KeyEvent& k) {
  if (k.code == Key::Escape || k.is_char(U'c')) {
    quit_prompt_ = false;
    set_status("Quit cancelled");
  } else if (k.is_char(U'n')) {
    quit_prompt_ = false;
    should_quit_ = true;
  } else if (k.is_char(U'y')) {
    quit_prompt_ = false;
    if (save(true) == Status::Ok) should_quit_ = true;
  }
}

bool Editor::motion_for(const KeyEvent& k, Motion& m) const {
  switch (k.code) {
    case Key::Left: m = k.ctrl ? Motion::WordBackward : Motion::CharLeft; return true;
    case Key::Right: m = k.ctrl ? Motion::WordForward : Motion::CharRight; return true;
    case Key::Up: m = Motion::LineUp; return true;
    case Key::Down: m = Motion::LineDown; return true;
    case Key::Home: m = k.ctrl ? Motion::DocumentStart : Motion::LineStart; return true;
    case Key::End: m = k.ctrl ? Motion::DocumentEnd : Motion::LineEnd; return true;
    case Key::PageUp: m = Motion::PageUp; return true;
    case Key::PageDown: m = Motion::PageDown; return true;
    default: return false;
  }
}

void Editor::move(Motion m) {
  apply_motion(buf_, cur_, m, MotionContext{navigate_cursor(), page_rows_});
}

void Editor::handle_write(const KeyEvent& k) {
  Motion m;
  if (motion_for(k, m)) { move(m); return; }
  switch (k.code) {
    case Key::Escape: enter_navigate(); return;
    case Key::Enter: insert_text("\n"); return;
    case Key::Tab: insert_text(std::string(static_cast<size_t>(cfg_.tab_width), ' ')); return;
    case Key::Backspace: backspace(); return;
    case Key::Delete: delete_forward(); return;
    case Key::Char:
      if (!k.ctrl && k.ch >= 0x20 && k.ch != 0x7F) {
        std::string s;
        utf8_append(s, k.ch);
        insert_text(s);
      }
      return;
    default: return;
  }
}

void Editor::handle_navigate(const KeyEvent& k) {
  switch (input_.feed(k)) {
    case SeqCommand::Pending: return;
    case SeqCommand::DeleteLine: delete_line(); return;
    case SeqCommand::YankLine: yank_line(); return;
    case SeqCommand::DocumentStart: move(Motion::DocumentStart); return;
    case SeqCommand::None: handle_navigate_single(k); return;
  }
}

void Editor::handle_navigate_single(const KeyEvent& k) {
  Motion m;
  if (motion_for(k, m)) { move(m); return; }
  if (k.is_ctrl(U'r')) { redo(); return; }
  if (k.code != Key::Char || k.ctrl) return;
  switch (k.ch) {
    case U'h': move(Motion::CharLeft); break;
    case U'j': move(Motion::LineDown); break;
    case U'k': move(Motion::LineUp); break;
    case U'l': move(Motion::CharRight); break;
    case U'w': move(Motion::WordForward); break;
    case U'b': move(Motion::WordBackward); break;
    case U'{': move(Motion::ParagraphBackward); break;
    case U'}': move(Motion::ParagraphForward); break;
    case U'0': move(Motion::LineStart); break;
    case U'$': move(Motion::LineEnd); break;
    case U'G': move(Motion::DocumentEnd); break;
    case U'p': paste_below(); break;
    case U'u': undo(); break;
    case U'i': enter_write(); break;
    case U'/': enter_search(); break;
    case U'n': search_step(true); break;
    case U'N': search_step(false); break;
    case U'?': open_overlay(ModeKind::Help); break;
    case U's': open_overlay(ModeKind::Stats); break;
    case U'v': open_overlay(ModeKind::History); break;
    default: break;
  }
}

void Editor::handle_search(SearchState& s, const KeyEvent& k) {
  switch (k.code) {
    case Key::Escape:
      search_.clear();
      enter_navigate();
      set_status("Search cancelled");
      return;
    case Key::Enter: {
      std::string q = s.query;
      enter_navigate();
      run_search(q);
      return;
    }
    case Key::Backspace: {
      std::u32string q = utf8_decode(s.query);
      if (!q.empty()) q.pop_back();
      s.query = utf8_encode(q);
      return;
    }
    case Key::Char:
      if (!k.ctrl && k.ch >= 0x20 && k.ch != 0x7F) utf8_append(s.query, k.ch);
      return;
    default: return;
  }
}

void Editor::handle_overlay(OverlayState& o, const KeyEvent& k) {
  if (o.kind == ModeKind::History) { handle_history(o, k); return; }
  enter_navigate();
}

void Editor::handle_history(OverlayState& o, const KeyEvent& k) {
  bool back = k.code == Key::Escape || k.is_char(U'q');
  bool down = k.code == Key::Down || k.is_char(U'j');
  bool up = k.code == Key::Up || k.is_char(U'k');
  if (o.view != HistoryView::List) {
    if (back) { o.view = HistoryView::List; o.lines.clear(); o.scroll = 0; }
    else if (down && o.scroll + 1 < o.lines.size()) ++o.scroll;
    else if (up && o.scroll > 0) --o.scroll;
    return;
  }
  if (back) { enter_navigate(); return; }
  if (o.records.empty()) return;
  if (down && o.selection + 1 < o.records.size()) ++o.selection;
  else if (up && o.selection > 0) --o.selection;
  else if (k.code == Key::Enter) show_version(o, false);
  else if (k.is_char(U'd')) show_version(o, true);
  else if (k.is_char(U'r')) restore_version(o);
}

void Editor::enter_write() {
  undo_.close_group();
  input_.reset();
  search_.clear();
  state_ = WriteState{};
}

void Editor::enter_navigate() {
  undo_.close_group();
  input_.reset();
  state_ = NavigateState{};
  clamp_cursor(buf_, cur_, true);
}

void Editor::enter_search() {
  undo_.close_group();
  input_.reset();
  state_ = SearchState{};
}

void Editor::open_overlay(ModeKind kind) {
  undo_.close_group();
  input_.reset();
  OverlayState o;
  o.kind = kind;
  if (kind == ModeKind::History) load_history(o);
  state_ = std::move(o);
}

void Editor::tick() {
  Clock::time_point t = now();
  if (cfg_.autosave_seconds > 0 && modified_ && t - last_autosave_ >= std::chrono::seconds(cfg_.autosave_seconds)) {
    last_autosave_ = t;
    save(false);
  }
  if (!status_.empty() && cfg_.status_timeout_seconds > 0 &&
      t - status_time_ >= std::chrono::seconds(cfg_.status_timeout_seconds)) {
    status_.clear();
  }
  drain_warnings();
}

RenderView Editor::view(size_t rows) {
  rows = std::max<size_t>(rows, 1);
  page_rows_ = rows;
  RenderView v;
  v.text_width = cfg_.text_width;
  v.file_name = path_.filename().string();
  v.status = status_;
  v.show_status_bar = show_status_;
  v.status_bar = status_bar_text();
  v.quit_prompt = quit_prompt_;

  LineCol lc = buf_.offset_to_line_col(std::min(cur_.offset, buf_.length()));
  if (lc.line < top_line_) top_line_ = lc.line;
  if (lc.line >= top_line_ + rows) top_line_ = lc.line - rows + 1;
  top_line_ = std::min(top_line_, buf_.line_count() - 1);
  v.cursor_row = lc.line - top_line_;
  v.cursor_col = lc.col;

  size_t end_line = std::min(buf_.line_count(), top_line_ + rows);
  const auto& matches = search_.matches();
  for (size_t line = top_line_; line < end_line; ++line) {
    Range r = buf_.line_range(line);
    ViewLine vl;
    vl.text = buf_.slice(r);
    auto it = std::lower_bound(matches.begin(), matches.end(), r.start,
                               [](const Range& m, size_t off) { return m.end <= off; });
    for (; it != matches.end() && it->start <= r.end; ++it) {
      size_t s = std::max(it->start, r.start);
      size_t e = std::min(it->end, r.end);
      if (e <= s) continue;
      bool current = search_.current() >= 0 && static_cast<size_t>(it - matches.begin()) == static_cast<size_t>(search_.current());
      vl.highlights.push_back(ViewSpan{s - r.start, e - s, current});
    }
    v.lines.push_back(std::move(vl));
  }

  if (auto* s = std::get_if<SearchState>(&state_)) v.search_prompt = "/" + s->query;
  if (auto* o = std::get_if<OverlayState>(&state_)) {
    OverlayView ov;
    switch (o->kind) {
      case ModeKind::Help:
        ov.title = "Help";
        ov.lines = help_lines();
        ov.footer = "Press any key to close";
        break;
      case ModeKind::Stats:
        ov.title = "Stats";
        ov.lines = stats_lines();
        ov.footer = "Press any key to close";
        break;
      default:
        if (o->view == HistoryView::List) {
          ov.title = "Version History";
          if (o->records.empty()) ov.lines.push_back(versions_ ? "No saved versions" : "Version history is disabled");
          for (size_t i = 0; i < o->records.size(); ++i) {
            const VersionRecord& r = o->records[i];
            ov.lines.push_back(format_timestamp(r.timestamp_ms) + "  " + std::to_string(r.word_count) + " words  " +
                               o->previews[i]);
          }
          if (!o->records.empty()) ov.selected = static_cast<int>(o->selection);
          ov.footer = "j/k select  Enter view  d diff  r restore  q back";
        } else {
          ov.title = o->view == HistoryView::Diff ? "Diff (version -> current)" : "Version";
          ov.diff = o->view == HistoryView::Diff;
          ov.lines.assign(o->lines.begin() + static_cast<std::ptrdiff_t>(std::min(o->scroll, o->lines.size())), o->lines.end());
          ov.footer = "j/k scroll  q back";
        }
        break;
    }
    v.overlay = std::move(ov);
  }
  return v;
}

void Editor::run(ITerminal& term) {
  Renderer renderer;
  while (!should_quit_) {
    TermSize sz = term.get_size();
    size_t rows = sz.rows > 1 ? static_cast<size_t>(sz.rows - 1) : 1;
    renderer.render(term, view(rows));
    if (auto k = term.read_key(SCRIBE_EVENT_POLL_MS)) handle_key(*k);
    tick();
  }
  shutdown();
}

void Editor::shutdown() {
  if (stats_file_.empty()) return;
  std::string msg;
  if (stats_.save(stats_file_, msg) != Status::Ok) set_status("Stats not saved: " + msg);
}
