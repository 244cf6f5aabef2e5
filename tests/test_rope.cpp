#include "rope.hpp"
#include <cassert>
#include <random>
#include <string>
#include "config.hpp"
#include "utf8.hpp"

static size_t newlines(const std::u32string& s) {
  size_t n = 0;
  for (char32_t c : s) if (c == U'\n') ++n;
  return n;
}

static void check_same(const Rope& r, const std::u32string& ref) {
  assert(r.check_invariants());
  assert(r.length() == ref.size());
  assert(r.to_u32string() == ref);
  assert(r.newline_count() == newlines(ref));
  assert(r.word_count() == count_words(std::u32string_view(ref)));
}

int main() {
  {
    Rope r;
    assert(r.length() == 0);
    assert(r.newline_count() == 0);
    assert(r.word_count() == 0);
    r.insert(0, U"hello world");
    r.insert(5, U",");
    check_same(r, U"hello, world");
    r.erase(0, 7);
    check_same(r, U"world");
    assert(r.char_at(0) == U'w');
    assert(r.slice(1, 3) == U"or");
  }
  {
    /* words spanning a leaf boundary are counted once */
    std::u32string text(SCRIBE_ROPE_LEAF_MAX - 2, U' ');
    text += U"abcdef more";
    Rope r(text);
    check_same(r, text);
    assert(r.word_count() == 2);
    r.insert(SCRIBE_ROPE_LEAF_MAX, U" ");
    text.insert(SCRIBE_ROPE_LEAF_MAX, U" ");
    check_same(r, text);
    assert(r.word_count() == 3);
  }
  {
    Rope r(U"a\nbb\n\nccc");
    assert(r.line_start(0) == 0);
    assert(r.line_start(1) == 2);
    assert(r.line_start(2) == 5);
    assert(r.line_start(3) == 6);
    assert(r.newlines_before(0) == 0);
    assert(r.newlines_before(2) == 1);
    assert(r.newlines_before(9) == 3);
  }
  {
    /* random edits against a plain string */
    std::mt19937 rng(1234);
    std::u32string ref;
    Rope r;
    const std::u32string alphabet = U"ab cd\né中.";
    for (int step = 0; step < 3000; ++step) {
      if (ref.empty() || rng() % 3 != 0) {
        size_t at = ref.empty() ? 0 : rng() % (ref.size() + 1);
        std::u32string piece;
        size_t n = 1 + rng() % 700;
        for (size_t i = 0; i < n; ++i) piece.push_back(alphabet[rng() % alphabet.size()]);
        r.insert(at, piece);
        ref.insert(at, piece);
      } else {
        size_t a = rng() % ref.size();
        size_t b = a + rng() % std::min<size_t>(ref.size() - a + 1, 900);
        r.erase(a, b);
        ref.erase(a, b - a);
      }
      if (step % 100 == 0) check_same(r, ref);
    }
    check_same(r, ref);
  }
  {
    /* large enough to take the parallel build path */
    std::u32string big;
    const std::u32string line = U"the quick brown fox jumps over the lazy dog\n";
    while (big.size() < 4200u * SCRIBE_ROPE_LEAF_MAX) big += line;
    Rope r(big);
    check_same(r, big);
    assert(r.height() < 20);
    size_t chunks = 0, total = 0;
    r.for_each_chunk([&](std::u32string_view c) {
      assert(!c.empty() && c.size() <= SCRIBE_ROPE_LEAF_MAX);
      ++chunks;
      total += c.size();
    });
    assert(total == big.size());
    assert(chunks >= big.size() / SCRIBE_ROPE_LEAF_MAX);
    r.erase(10, big.size() - 10);
    check_same(r, big.substr(0, 10));
  }
  return 0;
}
