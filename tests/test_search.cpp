#include "search.hpp"
#include <cassert>
#include <string>

int main() {
  {
    TextBuffer b("The cat, the mat");
    SearchEngine s;
    assert(s.execute(b, "the") == Status::Ok);
    assert(s.matches().size() == 2);
    assert((s.matches()[0] == Range{0, 3}));
    assert((s.matches()[1] == Range{9, 12}));
    assert(s.current() == 0);
    size_t cur = 0;
    assert(s.next(cur) == Status::Ok);
    assert(s.current() == 1 && cur == 9);
    assert(s.next(cur) == Status::Ok);
    assert(s.current() == 0 && cur == 0);
    assert(s.previous(cur) == Status::Ok);
    assert(s.current() == 1 && cur == 9);
    assert(b.text() == "The cat, the mat");
  }
  {
    /* the starting match is the first one at or after `from`, wrapping */
    TextBuffer b("ab ab ab");
    SearchEngine s;
    assert(s.execute(b, "AB", 1) == Status::Ok);
    assert(s.current() == 1);
    assert(s.execute(b, "ab", 7) == Status::Ok);
    assert(s.current() == 0);
  }
  {
    /* matches never overlap */
    TextBuffer b("aaaa");
    SearchEngine s;
    assert(s.execute(b, "aa") == Status::Ok);
    assert(s.matches().size() == 2);
    assert((s.matches()[1] == Range{2, 4}));
  }
  {
    /* offsets are code points; case folding covers non-ASCII */
    TextBuffer b("Ärger über ÄRGER");
    SearchEngine s;
    assert(s.execute(b, "ärger") == Status::Ok);
    assert(s.matches().size() == 2);
    assert((s.matches()[1] == Range{11, 16}));
  }
  {
    TextBuffer b("nothing here");
    SearchEngine s;
    assert(s.execute(b, "zzz") == Status::NoMatches);
    assert(s.current() == -1);
    size_t cur = 3;
    assert(s.next(cur) == Status::NoMatches);
    assert(s.previous(cur) == Status::NoMatches);
    assert(cur == 3);

    assert(s.execute(b, "") == Status::Ok);
    assert(!s.active());
    assert(s.matches().empty());
  }
  {
    /* refresh recomputes after an edit and keeps the current match position */
    TextBuffer b("one two one two");
    SearchEngine s;
    assert(s.execute(b, "two", 5) == Status::Ok);
    assert(s.current() == 1);
    b.insert(0, "two ");
    s.refresh(b);
    assert(s.matches().size() == 3);
    b.erase({0, b.length()});
    s.refresh(b);
    assert(s.matches().empty());
    assert(s.current() == -1);
    s.clear();
    assert(!s.active());
  }
  {
    auto r = find_all_folded(U"abcabcab", U"CAB");
    assert(r.size() == 2);
    assert((r[0] == Range{2, 5}));
    assert((r[1] == Range{5, 8}));
  }
  return 0;
}
