#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Text is UTF-8; rows and columns are screen cells.
 */
#include <optional>
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

enum ColorPair { PairDefault = 0, PairMatch = 1, PairAdded = 2, PairRemoved = 3 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  /* reverse video over code points [hl_start, hl_start + hl_len) of text */
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  /* waits at most timeout_ms; nullopt on timeout or a key with no logical meaning */
  virtual std::optional<KeyEvent> read_key(int timeout_ms) = 0;
};
