#pragma once
/*
 * SearchEngine
 *
 * Purpose: case-insensitive substring search over the whole document.
 * Matches: non-overlapping, earliest start first (KMP over case-folded text).
 * State: query, match ranges and current index (-1 when none); the editor
 * clears it on cancel and when leaving search-driven navigation.
 */
#include <string>
#include <vector>
#include "text_buffer.hpp"
#include "types.hpp"

class SearchEngine {
public:
  /* empty query clears state and returns Ok; zero matches returns NoMatches.
     current becomes the first match starting at or after `from`, wrapping to 0. */
  Status execute(const TextBuffer& buf, const std::string& query, size_t from = 0);
  /* re-run the active query after an edit, keeping the nearest current match */
  void refresh(const TextBuffer& buf);
  Status next(size_t& cursor);
  Status previous(size_t& cursor);
  void clear();

  bool active() const { return !query_.empty(); }
  const std::string& query() const { return query_; }
  const std::vector<Range>& matches() const { return matches_; }
  int current() const { return current_; }

private:
  std::string query_;
  std::vector<Range> matches_;
  int current_ = -1;
};

/* non-overlapping case-insensitive occurrences of `needle` in `hay` */
std::vector<Range> find_all_folded(const std::u32string& hay, const std::u32string& needle);
