#include "ncurses_terminal.hpp"
#include <algorithm>
#include <cstring>
#include "utf8.hpp"

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    colors_ = true;
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(PairMatch, COLOR_BLACK, COLOR_YELLOW);
    init_pair(PairAdded, COLOR_GREEN, bg);
    init_pair(PairRemoved, COLOR_RED, bg);
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  std::u32string s = utf8_decode(text);
  int len = (int)s.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  std::string left = utf8_encode(s.substr(0, hl_start));
  std::string mid = utf8_encode(s.substr(hl_start, hl_end - hl_start));
  std::string right = utf8_encode(s.substr(hl_end));
  mvaddnstr(row, col, left.c_str(), (int)left.size());
  attron(A_REVERSE);
  addnstr(mid.c_str(), (int)mid.size());
  attroff(A_REVERSE);
  addnstr(right.c_str(), (int)right.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!colors_) {
    /* monochrome: the current match still has to stand out */
    if (color_pair_id == PairMatch) attron(A_BOLD | A_REVERSE);
    mvaddnstr(row, col, text.c_str(), (int)text.size());
    if (color_pair_id == PairMatch) attroff(A_BOLD | A_REVERSE);
    return;
  }
  attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

std::optional<KeyEvent> NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  wint_t ch = 0;
  int rc = get_wch(&ch);
  if (rc == ERR) return std::nullopt;
  return translate_key(rc, ch, rc == KEY_CODE_YES ? keyname((int)ch) : nullptr);
}

std::optional<KeyEvent> translate_key(int rc, wint_t ch, const char* name) {
  if (rc == KEY_CODE_YES) {
    switch (ch) {
      case KEY_LEFT: return KeyEvent::key(Key::Left);
      case KEY_RIGHT: return KeyEvent::key(Key::Right);
      case KEY_UP: return KeyEvent::key(Key::Up);
      case KEY_DOWN: return KeyEvent::key(Key::Down);
      case KEY_HOME: return KeyEvent::key(Key::Home);
      case KEY_END: return KeyEvent::key(Key::End);
      case KEY_PPAGE: return KeyEvent::key(Key::PageUp);
      case KEY_NPAGE: return KeyEvent::key(Key::PageDown);
      case KEY_DC: return KeyEvent::key(Key::Delete);
      case KEY_BACKSPACE: return KeyEvent::key(Key::Backspace);
      case KEY_ENTER: return KeyEvent::key(Key::Enter);
      default: break;
    }
    /* xterm-style modified keys have no KEY_ constant; 5 is Ctrl */
    if (!name) return std::nullopt;
    if (std::strcmp(name, "kLFT5") == 0) return KeyEvent::key(Key::Left, true);
    if (std::strcmp(name, "kRIT5") == 0) return KeyEvent::key(Key::Right, true);
    if (std::strcmp(name, "kHOM5") == 0) return KeyEvent::key(Key::Home, true);
    if (std::strcmp(name, "kEND5") == 0) return KeyEvent::key(Key::End, true);
    return std::nullopt;
  }
  switch (ch) {
    case 27: return KeyEvent::key(Key::Escape);
    case 10: case 13: return KeyEvent::key(Key::Enter);
    case 127: case 8: return KeyEvent::key(Key::Backspace);
    case 9: return KeyEvent::key(Key::Tab);
    default: break;
  }
  if (ch >= 1 && ch <= 26) return KeyEvent::ctrl_chr(U'a' + (char32_t)(ch - 1));
  if (ch < 0x20) return std::nullopt;
  return KeyEvent::chr((char32_t)ch);
}
