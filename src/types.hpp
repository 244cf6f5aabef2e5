#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Status/Range/KeyEvent).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <stdexcept>
#include <string>

enum class Status {
  Ok,
  InvalidPosition,
  NothingToUndo,
  NothingToRedo,
  NoMatches,
  IoError,
  VersionRecordCorrupt,
  ConfigInvalid
};

/* thrown by TextBuffer on out-of-range offsets; callers clamp before calling */
class InvalidPosition : public std::out_of_range {
public:
  explicit InvalidPosition(const std::string& what) : std::out_of_range(what) {}
};

/* half-open [start, end) in code points */
struct Range {
  size_t start = 0;
  size_t end = 0;
  size_t size() const { return end - start; }
  bool operator==(const Range&) const = default;
};

struct LineCol {
  size_t line = 0;
  size_t col = 0;
  bool operator==(const LineCol&) const = default;
};

enum class Key {
  Char,
  Enter,
  Escape,
  Backspace,
  Delete,
  Tab,
  Left,
  Right,
  Up,
  Down,
  Home,
  End,
  PageUp,
  PageDown
};

/* logical key event produced by the terminal layer */
struct KeyEvent {
  Key code = Key::Char;
  char32_t ch = 0;
  bool ctrl = false;

  static KeyEvent chr(char32_t c) { return KeyEvent{Key::Char, c, false}; }
  static KeyEvent ctrl_chr(char32_t c) { return KeyEvent{Key::Char, c, true}; }
  static KeyEvent key(Key k, bool ctrl = false) { return KeyEvent{k, 0, ctrl}; }
  bool is_char(char32_t c) const { return code == Key::Char && !ctrl && ch == c; }
  bool is_ctrl(char32_t c) const { return code == Key::Char && ctrl && ch == c; }
};
