#include "search.hpp"
#include "utf8.hpp"

static std::vector<int> kmp_build(const std::u32string& pat) {
  std::vector<int> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = (int)j;
  }
  return pi;
}

static std::u32string folded(const std::u32string& s) {
  std::u32string out;
  out.reserve(s.size());
  for (char32_t c : s) out.push_back(fold_case(c));
  return out;
}

std::vector<Range> find_all_folded(const std::u32string& hay, const std::u32string& needle) {
  std::vector<Range> out;
  if (needle.empty()) return out;
  std::u32string pat = folded(needle);
  auto pi = kmp_build(pat);
  size_t j = 0;
  for (size_t i = 0; i < hay.size(); ++i) {
    char32_t c = fold_case(hay[i]);
    while (j > 0 && c != pat[j]) j = pi[j - 1];
    if (c == pat[j]) ++j;
    if (j == pat.size()) {
      out.push_back({i + 1 - pat.size(), i + 1});
      j = 0; /* restart after the match: no overlaps */
    }
  }
  return out;
}

Status SearchEngine::execute(const TextBuffer& buf, const std::string& query, size_t from) {
  clear();
  if (query.empty()) return Status::Ok;
  query_ = query;
  matches_ = find_all_folded(buf.text32(), utf8_decode(query));
  if (matches_.empty()) return Status::NoMatches;
  current_ = 0;
  for (size_t i = 0; i < matches_.size(); ++i) {
    if (matches_[i].start >= from) { current_ = static_cast<int>(i); break; }
  }
  return Status::Ok;
}

void SearchEngine::refresh(const TextBuffer& buf) {
  if (query_.empty()) return;
  size_t anchor = (current_ >= 0) ? matches_[static_cast<size_t>(current_)].start : 0;
  std::string q = query_;
  if (execute(buf, q, anchor) == Status::NoMatches) current_ = -1;
}

Status SearchEngine::next(size_t& cursor) {
  if (matches_.empty()) return Status::NoMatches;
  current_ = (current_ + 1) % static_cast<int>(matches_.size());
  cursor = matches_[static_cast<size_t>(current_)].start;
  return Status::Ok;
}

Status SearchEngine::previous(size_t& cursor) {
  if (matches_.empty()) return Status::NoMatches;
  int n = static_cast<int>(matches_.size());
  current_ = (current_ <= 0) ? n - 1 : current_ - 1;
  cursor = matches_[static_cast<size_t>(current_)].start;
  return Status::Ok;
}

void SearchEngine::clear() {
  query_.clear();
  matches_.clear();
  current_ = -1;
}
