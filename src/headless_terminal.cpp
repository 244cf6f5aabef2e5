#include "headless_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign((size_t)rows_, std::u32string((size_t)cols_, U' '));
  attrs_.assign((size_t)rows_, std::string((size_t)cols_, Plain));
}

void HeadlessTerminal::put(int row, int col, const std::u32string& s, char attr) {
  if (row < 0 || row >= rows_) return;
  int c = col;
  for (char32_t ch : s) {
    int w = char_width(ch);
    if (w == 0) continue;
    if (c + w > cols_) break;
    for (int k = 0; k < w; ++k) {
      if (c + k < 0) continue;
      /* the second cell of a wide character holds no code point of its own */
      cells_[(size_t)row][(size_t)(c + k)] = k == 0 ? ch : WIDE_TAIL;
      attrs_[(size_t)row][(size_t)(c + k)] = attr;
    }
    c += w;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, utf8_decode(text), Plain);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  std::u32string s = utf8_decode(text);
  int len = (int)s.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  std::u32string_view v(s);
  int mid = col + (int)display_width(v.substr(0, hl_start));
  int tail = mid + (int)display_width(v.substr(hl_start, hl_end - hl_start));
  put(row, col, s.substr(0, hl_start), Plain);
  put(row, mid, s.substr(hl_start, hl_end - hl_start), Reverse);
  put(row, tail, s.substr(hl_end), Plain);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  last_color_ = color_pair_id;
  put(row, col, utf8_decode(text), color_pair_id == PairDefault ? Plain : Colored);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(col, 0); c < cols_; ++c) {
    cells_[(size_t)row][(size_t)c] = U' ';
    attrs_[(size_t)row][(size_t)c] = Plain;
  }
}

std::optional<KeyEvent> HeadlessTerminal::read_key(int) {
  if (!keys_.empty()) {
    KeyEvent k = keys_.front();
    keys_.pop_front();
    return k;
  }
  return (drained_++ % 2 == 0) ? KeyEvent::ctrl_chr(U'q') : KeyEvent::chr(U'n');
}

void HeadlessTerminal::push_text(const std::string& utf8) {
  for (char32_t c : utf8_decode(utf8)) keys_.push_back(KeyEvent::chr(c));
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return {};
  std::u32string s;
  for (char32_t c : cells_[(size_t)row]) if (c != WIDE_TAIL) s.push_back(c);
  while (!s.empty() && s.back() == U' ') s.pop_back();
  return utf8_encode(s);
}

std::string HeadlessTerminal::row_attrs(int row) const {
  if (row < 0 || row >= rows_) return {};
  return attrs_[(size_t)row];
}

bool HeadlessTerminal::screen_contains(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) {
    if (row_text(r).find(needle) != std::string::npos) return true;
  }
  return false;
}
