#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests. Keeps a grid of code points plus a
 * per-cell attribute, and replays a scripted key queue. Wide characters take
 * two cells, as on a real terminal.
 * When the script runs out it answers Ctrl-Q then 'n', so an event loop under
 * test always terminates.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  enum Attr : char { Plain = ' ', Reverse = 'R', Colored = 'C' };

  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refreshes_; }
  void clear_to_eol(int row, int col) override;
  std::optional<KeyEvent> read_key(int timeout_ms) override;

  void resize(int rows, int cols);
  void push_key(const KeyEvent& k) { keys_.push_back(k); }
  /* each code point becomes a plain character key */
  void push_text(const std::string& utf8);

  /* row contents as UTF-8 with trailing blanks removed */
  std::string row_text(int row) const;
  /* attribute markers for a row, one char per cell */
  std::string row_attrs(int row) const;
  bool screen_contains(const std::string& needle) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }
  int last_color() const { return last_color_; }

private:
  static constexpr char32_t WIDE_TAIL = 0;

  int rows_;
  int cols_;
  std::vector<std::u32string> cells_;
  std::vector<std::string> attrs_;
  std::deque<KeyEvent> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
  int last_color_ = 0;
  int drained_ = 0;

  void put(int row, int col, const std::u32string& s, char attr);
};
