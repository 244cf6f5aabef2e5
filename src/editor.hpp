#pragma once
/*
 * Editor
 *
 * Purpose: the modal command dispatcher. Owns one document session (buffer,
 * cursor, register, undo, search, versions, stats) and turns logical key
 * events into operations on it.
 * Modes: a tagged variant (Write / Navigate / Search / Overlay); the quit
 * confirmation is a sub-state layered over whichever mode was active.
 * Time: both clocks are injectable so grouping, autosave and status expiry
 * can be driven deterministically.
 */
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"
#include "cursor.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "render_view.hpp"
#include "search.hpp"
#include "stats_tracker.hpp"
#include "text_buffer.hpp"
#include "types.hpp"
#include "undo_manager.hpp"
#include "version_store.hpp"

enum class ModeKind { Write, Navigate, Search, Help, Stats, History };

const char* mode_label(ModeKind m);

class Editor {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;
  using WallClockFn = std::function<std::chrono::system_clock::time_point()>;

  Editor(Config cfg, std::filesystem::path file, ClockFn clock = {}, WallClockFn wall = {});

  /* read the document (missing file starts empty) and the persisted stats */
  Status open(std::string& msg);
  void handle_key(const KeyEvent& k);
  /* periodic maintenance: autosave and status expiry */
  void tick();
  RenderView view(size_t rows);
  void run(ITerminal& term);
  void shutdown();

  Status save(bool manual);

  ModeKind mode() const;
  bool should_quit() const { return should_quit_; }
  bool quit_prompt_open() const { return quit_prompt_; }
  bool modified() const { return modified_; }
  const std::string& status() const { return status_; }
  const TextBuffer& buffer() const { return buf_; }
  const Cursor& cursor() const { return cur_; }
  const std::optional<std::string>& register_content() const { return register_; }
  const SearchEngine& search() const { return search_; }
  const UndoManager& undo_manager() const { return undo_; }
  const StatsTracker& stats() const { return stats_; }
  VersionStore* versions() { return versions_.get(); }
  const Config& config() const { return cfg_; }
  std::filesystem::path backup_path() const;

private:
  struct WriteState {};
  struct NavigateState {};
  struct SearchState { std::string query; };
  enum class HistoryView { List, Content, Diff };
  struct OverlayState {
    ModeKind kind = ModeKind::Help;
    HistoryView view = HistoryView::List;
    std::vector<VersionRecord> records; /* newest first */
    std::vector<std::string> previews;
    size_t selection = 0;
    std::vector<std::string> lines;     /* content or diff being shown */
    size_t scroll = 0;
  };
  using ModeState = std::variant<WriteState, NavigateState, SearchState, OverlayState>;

  Config cfg_;
  std::filesystem::path path_;
  ClockFn clock_;
  WallClockFn wall_;

  TextBuffer buf_;
  Cursor cur_;
  std::optional<std::string> register_;
  UndoManager undo_;
  SearchEngine search_;
  std::unique_ptr<VersionStore> versions_;
  StatsTracker stats_;
  std::filesystem::path stats_file_;
  Input input_;

  ModeState state_{WriteState{}};
  bool quit_prompt_ = false;
  bool should_quit_ = false;
  bool modified_ = false;
  bool file_existed_ = false;
  bool backup_done_ = false;
  bool show_status_ = false;
  std::string status_;
  Clock::time_point status_time_{};
  Clock::time_point last_autosave_{};
  size_t top_line_ = 0;
  size_t page_rows_ = 20;

  Clock::time_point now() const { return clock_(); }
  Date today() const { return local_today(wall_()); }
  bool navigate_cursor() const;
  void set_status(const std::string& msg);
  void drain_warnings();

  /* dispatch (editor.cpp) */
  bool handle_universal(const KeyEvent& k);
  void handle_quit_prompt(const KeyEvent& k);
  void handle_write(const KeyEvent& k);
  void handle_navigate(const KeyEvent& k);
  void handle_navigate_single(const KeyEvent& k);
  void handle_search(SearchState& s, const KeyEvent& k);
  void handle_overlay(OverlayState& o, const KeyEvent& k);
  void handle_history(OverlayState& o, const KeyEvent& k);
  void enter_write();
  void enter_navigate();
  void enter_search();
  void open_overlay(ModeKind kind);
  bool motion_for(const KeyEvent& k, Motion& m) const;
  void move(Motion m);

  /* operations (editor_commands.cpp) */
  void ensure_backup();
  void commit_edit(EditClass kind, Delta d, size_t cursor_before, size_t cursor_after);
  void after_change(bool count_words);
  void insert_text(const std::string& text);
  void backspace();
  void delete_forward();
  void delete_line();
  void yank_line();
  void paste_below();
  void undo();
  void redo();
  void request_quit();
  void run_search(const std::string& query);
  void search_step(bool forward);
  void load_history(OverlayState& o);
  void show_version(OverlayState& o, bool as_diff);
  void restore_version(OverlayState& o);
  std::vector<std::string> help_lines() const;
  std::vector<std::string> stats_lines() const;
  std::string status_bar_text() const;
};
