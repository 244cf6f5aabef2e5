#include "ncurses_terminal.hpp"
#include <cassert>

static bool is(const std::optional<KeyEvent>& k, const KeyEvent& want) {
  return k && k->code == want.code && k->ch == want.ch && k->ctrl == want.ctrl;
}

int main() {
  assert(is(translate_key(OK, L'a', nullptr), KeyEvent::chr(U'a')));
  assert(is(translate_key(OK, 0x4E2D, nullptr), KeyEvent::chr(U'中')));
  assert(is(translate_key(OK, 27, nullptr), KeyEvent::key(Key::Escape)));
  assert(is(translate_key(OK, 13, nullptr), KeyEvent::key(Key::Enter)));
  assert(is(translate_key(OK, 10, nullptr), KeyEvent::key(Key::Enter)));
  assert(is(translate_key(OK, 127, nullptr), KeyEvent::key(Key::Backspace)));
  assert(is(translate_key(OK, 9, nullptr), KeyEvent::key(Key::Tab)));
  assert(is(translate_key(OK, 19, nullptr), KeyEvent::ctrl_chr(U's')));
  assert(is(translate_key(OK, 17, nullptr), KeyEvent::ctrl_chr(U'q')));
  assert(is(translate_key(OK, 26, nullptr), KeyEvent::ctrl_chr(U'z')));
  assert(!translate_key(OK, 0, nullptr));
  assert(!translate_key(OK, 28, nullptr));

  assert(is(translate_key(KEY_CODE_YES, KEY_LEFT, nullptr), KeyEvent::key(Key::Left)));
  assert(is(translate_key(KEY_CODE_YES, KEY_NPAGE, nullptr), KeyEvent::key(Key::PageDown)));
  assert(is(translate_key(KEY_CODE_YES, KEY_DC, nullptr), KeyEvent::key(Key::Delete)));
  assert(is(translate_key(KEY_CODE_YES, KEY_BACKSPACE, nullptr), KeyEvent::key(Key::Backspace)));
  assert(is(translate_key(KEY_CODE_YES, 600, "kLFT5"), KeyEvent::key(Key::Left, true)));
  assert(is(translate_key(KEY_CODE_YES, 601, "kEND5"), KeyEvent::key(Key::End, true)));
  assert(!translate_key(KEY_CODE_YES, 602, "kUP5"));
  assert(!translate_key(KEY_CODE_YES, KEY_RESIZE, nullptr));
  return 0;
}
