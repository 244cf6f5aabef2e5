#pragma once
/*
 * Cursor
 *
 * Purpose: cursor state (offset + sticky column) and motion semantics.
 * Rules: horizontal, word and line-start/end motions reset the sticky column;
 * vertical and page motions read it but never change it.
 * Navigate mode never rests one past the last character of a non-empty line.
 */
#include <cstddef>
#include "text_buffer.hpp"

struct Cursor {
  size_t offset = 0;
  size_t sticky_col = 0;
};

enum class Motion {
  CharLeft,
  CharRight,
  LineUp,
  LineDown,
  WordForward,
  WordBackward,
  ParagraphForward,
  ParagraphBackward,
  LineStart,
  LineEnd,
  DocumentStart,
  DocumentEnd,
  PageUp,
  PageDown
};

struct MotionContext {
  bool navigate = false;
  size_t page_rows = 1; /* visible rows, supplied by the renderer */
};

void apply_motion(const TextBuffer& buf, Cursor& cur, Motion m, const MotionContext& ctx);

/* keep offset in [0, length]; in navigate mode also pull back from one-past-end */
void clamp_cursor(const TextBuffer& buf, Cursor& cur, bool navigate);

/* jump to an absolute offset (clamped) and reset the sticky column */
void set_cursor(const TextBuffer& buf, Cursor& cur, size_t offset, bool navigate);

bool is_blank_line(const TextBuffer& buf, size_t line);
