#include "cursor.hpp"
#include <algorithm>
#include "utf8.hpp"

enum class CharClass { Space, Word, Symbol };

static CharClass class_of(char32_t c) {
  if (is_space_char(c)) return CharClass::Space;
  if (is_word_char(c)) return CharClass::Word;
  return CharClass::Symbol;
}

static size_t col_of(const TextBuffer& buf, size_t offset) { return buf.offset_to_line_col(offset).col; }

/* largest column the cursor may rest on in `line` */
static size_t max_col(const TextBuffer& buf, size_t line, bool navigate) {
  size_t len = buf.line_length(line);
  return (navigate && len > 0) ? len - 1 : len;
}

static void move_to_line(const TextBuffer& buf, Cursor& cur, size_t line, bool navigate) {
  size_t col = std::min(cur.sticky_col, max_col(buf, line, navigate));
  cur.offset = buf.line_col_to_offset(line, col);
}

static size_t word_forward(const TextBuffer& buf, size_t p) {
  size_t len = buf.length();
  if (p >= len) return len;
  size_t start = p;
  CharClass c = class_of(buf.char_at(p));
  if (c != CharClass::Space) {
    while (p < len && class_of(buf.char_at(p)) == c) ++p;
  }
  while (p < len && class_of(buf.char_at(p)) == CharClass::Space) {
    char32_t ch = buf.char_at(p);
    /* an empty line stops the skip */
    if (ch == U'\n' && p + 1 < len && buf.char_at(p + 1) == U'\n' && p + 1 > start) return p + 1;
    ++p;
  }
  return p;
}

static size_t word_backward(const TextBuffer& buf, size_t p) {
  if (p == 0) return 0;
  --p;
  while (p > 0 && class_of(buf.char_at(p)) == CharClass::Space) {
    if (buf.char_at(p) == U'\n' && buf.char_at(p - 1) == U'\n') return p;
    --p;
  }
  if (class_of(buf.char_at(p)) == CharClass::Space) return p;
  CharClass c = class_of(buf.char_at(p));
  while (p > 0 && class_of(buf.char_at(p - 1)) == c) --p;
  return p;
}

bool is_blank_line(const TextBuffer& buf, size_t line) {
  if (line >= buf.line_count()) return true;
  std::u32string s = buf.slice32(buf.line_range(line));
  return std::all_of(s.begin(), s.end(), [](char32_t c) { return is_space_char(c); });
}

static size_t paragraph_forward(const TextBuffer& buf, size_t line) {
  size_t max_line = buf.line_count() - 1;
  while (line < max_line && !is_blank_line(buf, line)) ++line;
  while (line < max_line && is_blank_line(buf, line)) ++line;
  return line;
}

static size_t paragraph_backward(const TextBuffer& buf, size_t line) {
  if (line > 0 && !is_blank_line(buf, line)) --line;
  while (line > 0 && is_blank_line(buf, line)) --line;
  while (line > 0 && !is_blank_line(buf, line - 1)) --line;
  return line;
}

void clamp_cursor(const TextBuffer& buf, Cursor& cur, bool navigate) {
  cur.offset = std::min(cur.offset, buf.length());
  if (!navigate) return;
  LineCol lc = buf.offset_to_line_col(cur.offset);
  size_t mc = max_col(buf, lc.line, true);
  if (lc.col > mc) cur.offset -= lc.col - mc;
}

void set_cursor(const TextBuffer& buf, Cursor& cur, size_t offset, bool navigate) {
  cur.offset = std::min(offset, buf.length());
  clamp_cursor(buf, cur, navigate);
  cur.sticky_col = col_of(buf, cur.offset);
}

void apply_motion(const TextBuffer& buf, Cursor& cur, Motion m, const MotionContext& ctx) {
  clamp_cursor(buf, cur, ctx.navigate);
  LineCol lc = buf.offset_to_line_col(cur.offset);
  size_t last_line = buf.line_count() - 1;
  bool horizontal = true;
  switch (m) {
    case Motion::CharLeft:
      if (cur.offset > 0) {
        --cur.offset;
        if (ctx.navigate) {
          LineCol n = buf.offset_to_line_col(cur.offset);
          if (n.col > max_col(buf, n.line, true)) --cur.offset;
        }
      }
      break;
    case Motion::CharRight:
      if (cur.offset < buf.length()) {
        ++cur.offset;
        if (ctx.navigate) {
          LineCol n = buf.offset_to_line_col(cur.offset);
          if (n.col > max_col(buf, n.line, true)) {
            if (n.line < last_line) cur.offset = buf.line_range(n.line + 1).start;
            else --cur.offset;
          }
        }
      }
      break;
    case Motion::LineUp:
      horizontal = false;
      if (lc.line > 0) move_to_line(buf, cur, lc.line - 1, ctx.navigate);
      break;
    case Motion::LineDown:
      horizontal = false;
      if (lc.line < last_line) move_to_line(buf, cur, lc.line + 1, ctx.navigate);
      break;
    case Motion::PageUp:
      horizontal = false;
      move_to_line(buf, cur, lc.line - std::min(lc.line, std::max<size_t>(ctx.page_rows, 1)), ctx.navigate);
      break;
    case Motion::PageDown:
      horizontal = false;
      move_to_line(buf, cur, std::min(last_line, lc.line + std::max<size_t>(ctx.page_rows, 1)), ctx.navigate);
      break;
    case Motion::WordForward:
      cur.offset = word_forward(buf, cur.offset);
      break;
    case Motion::WordBackward:
      cur.offset = word_backward(buf, cur.offset);
      break;
    case Motion::ParagraphForward:
      cur.offset = buf.line_range(paragraph_forward(buf, lc.line)).start;
      break;
    case Motion::ParagraphBackward:
      cur.offset = buf.line_range(paragraph_backward(buf, lc.line)).start;
      break;
    case Motion::LineStart:
      cur.offset = buf.line_range(lc.line).start;
      break;
    case Motion::LineEnd:
      cur.offset = buf.line_range(lc.line).end;
      break;
    case Motion::DocumentStart:
      cur.offset = 0;
      break;
    case Motion::DocumentEnd:
      cur.offset = buf.length();
      break;
  }
  clamp_cursor(buf, cur, ctx.navigate);
  if (horizontal) cur.sticky_col = col_of(buf, cur.offset);
}
