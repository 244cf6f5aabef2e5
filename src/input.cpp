#include "input.hpp"

bool Input::is_prefix(const KeyEvent& k) {
  return k.is_char(U'd') || k.is_char(U'y') || k.is_char(U'g');
}

SeqCommand Input::feed(const KeyEvent& k) {
  if (pending_ != 0) {
    char32_t p = pending_;
    pending_ = 0;
    if (k.is_char(p)) {
      if (p == U'd') return SeqCommand::DeleteLine;
      if (p == U'y') return SeqCommand::YankLine;
      return SeqCommand::DocumentStart;
    }
  }
  if (is_prefix(k)) {
    pending_ = k.ch;
    return SeqCommand::Pending;
  }
  return SeqCommand::None;
}
