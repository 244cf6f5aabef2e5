#include "undo_manager.hpp"
#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using Clock = UndoManager::Clock;

/* type one character at the cursor and record it */
static void type(TextBuffer& b, UndoManager& um, size_t& cur, const std::string& s, Clock::time_point t) {
  Delta d;
  d.offset = cur;
  d.inserted = b.insert(cur, s);
  um.record(EditClass::Insert, d, cur, cur + 1, t);
  cur += 1;
}

static void backspace(TextBuffer& b, UndoManager& um, size_t& cur, Clock::time_point t) {
  Delta d;
  d.offset = cur - 1;
  d.removed = b.erase({cur - 1, cur});
  um.record(EditClass::Delete, d, cur, cur - 1, t);
  cur -= 1;
}

int main() {
  const Clock::time_point t0{};
  {
    /* adjacent inserts within the window form one group */
    TextBuffer b;
    UndoManager um;
    size_t cur = 0;
    type(b, um, cur, "a", t0);
    type(b, um, cur, "b", t0 + 1500ms);
    assert(b.text() == "ab");
    assert(um.undo_size() == 1);
    size_t c = 99;
    assert(um.undo(b, c) == Status::Ok);
    assert(b.text().empty());
    assert(c == 0);
    assert(um.redo(b, c) == Status::Ok);
    assert(b.text() == "ab");
    assert(c == 2);
  }
  {
    /* the same two inserts more than two seconds apart are two groups */
    TextBuffer b;
    UndoManager um;
    size_t cur = 0;
    type(b, um, cur, "a", t0);
    type(b, um, cur, "b", t0 + 2001ms);
    assert(um.undo_size() == 2);
    size_t c = 0;
    assert(um.undo(b, c) == Status::Ok);
    assert(b.text() == "a");
    assert(c == 1);
  }
  {
    /* a change of class or a jump in position starts a new group */
    TextBuffer b;
    UndoManager um;
    size_t cur = 0;
    type(b, um, cur, "a", t0);
    type(b, um, cur, "b", t0 + 10ms);
    backspace(b, um, cur, t0 + 20ms);
    backspace(b, um, cur, t0 + 30ms);
    assert(um.undo_size() == 2);
    cur = 0;
    type(b, um, cur, "x", t0 + 40ms);
    cur = 0;
    type(b, um, cur, "y", t0 + 50ms);
    assert(b.text() == "yx");
    assert(um.undo_size() == 4);
  }
  {
    /* undo inverse law and redo law over a mixed sequence */
    TextBuffer b("seed\n");
    UndoManager um;
    std::vector<std::string> states{b.text()};
    size_t cur = 5;
    Clock::time_point t = t0;
    for (int i = 0; i < 6; ++i) {
      t += 3s;
      type(b, um, cur, i % 2 ? "é" : "\n", t);
      states.push_back(b.text());
      t += 3s;
      backspace(b, um, cur, t);
      states.push_back(b.text());
      t += 3s;
      type(b, um, cur, "w", t);
      states.push_back(b.text());
    }
    const std::string final_text = b.text();
    size_t n = um.undo_size();
    assert(n == states.size() - 1);
    size_t c = 0;
    for (size_t i = 0; i < n; ++i) {
      assert(um.undo(b, c) == Status::Ok);
      assert(b.text() == states[states.size() - 2 - i]);
    }
    assert(b.text() == "seed\n");
    assert(um.undo(b, c) == Status::NothingToUndo);
    for (size_t i = 0; i < n; ++i) assert(um.redo(b, c) == Status::Ok);
    assert(b.text() == final_text);
    assert(um.redo(b, c) == Status::NothingToRedo);
  }
  {
    /* a fresh edit clears redo; close_group seals the open group */
    TextBuffer b;
    UndoManager um;
    size_t cur = 0;
    type(b, um, cur, "a", t0);
    assert(um.has_open_group());
    size_t c = 0;
    assert(um.undo(b, c) == Status::Ok);
    assert(um.can_redo());
    cur = 0;
    type(b, um, cur, "z", t0 + 1s);
    assert(!um.can_redo());
    um.close_group();
    assert(!um.has_open_group());
    type(b, um, cur, "z", t0 + 1100ms);
    assert(um.undo_size() == 2);
    um.clear();
    assert(!um.can_undo() && !um.can_redo());
    assert(um.undo(b, c) == Status::NothingToUndo);
  }
  return 0;
}
