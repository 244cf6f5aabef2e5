#pragma once
#include "types.hpp"
/*
 * Input
 *
 * Purpose: parse Navigate mode double key prefixes (dd/yy/gg) with minimal state.
 * A key that does not complete the buffered prefix drops it and is parsed
 * again as a fresh key, so it may start a prefix of its own. No timeout.
 */

enum class SeqCommand { None, Pending, DeleteLine, YankLine, DocumentStart };

class Input {
public:
  /* None means "not part of a sequence": the caller handles the key alone */
  SeqCommand feed(const KeyEvent& k);
  bool pending() const { return pending_ != 0; }
  char32_t pending_key() const { return pending_; }
  void reset() { pending_ = 0; }
private:
  static bool is_prefix(const KeyEvent& k);
  char32_t pending_ = 0;
};
