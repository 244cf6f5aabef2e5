#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using wide-character ncurses for drawing
 * and key input.
 * Note: initialization/teardown is owned by TerminalSession.
 */
#include <cwchar>
#include <ncurses.h>
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  std::optional<KeyEvent> read_key(int timeout_ms) override;
private:
  bool colors_ = false;
};

/* map one get_wch result to a logical key; exposed for the key table test */
std::optional<KeyEvent> translate_key(int rc, wint_t ch, const char* name);
