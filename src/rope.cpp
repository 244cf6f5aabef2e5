#include "rope.hpp"
#include <algorithm>
#include <cstdlib>
#include <future>
#include "config.hpp"
#include "types.hpp"
#include "utf8.hpp"

static constexpr size_t LEAF_MAX = SCRIBE_ROPE_LEAF_MAX;
static constexpr size_t PARALLEL_MIN_CHUNKS = 4096;

Rope::Rope(std::u32string_view text) : root_(build(text)) {}

Rope::Stats Rope::leaf_stats(std::u32string_view s) {
  Stats st;
  st.chars = s.size();
  st.newlines = static_cast<size_t>(std::count(s.begin(), s.end(), U'\n'));
  st.words = count_words(s);
  st.starts_word = !s.empty() && !is_space_char(s.front());
  st.ends_word = !s.empty() && !is_space_char(s.back());
  return st;
}

Rope::Stats Rope::combine(const Stats& a, const Stats& b) {
  Stats st;
  st.chars = a.chars + b.chars;
  st.newlines = a.newlines + b.newlines;
  st.words = a.words + b.words - ((a.ends_word && b.starts_word) ? 1 : 0);
  st.starts_word = a.chars ? a.starts_word : b.starts_word;
  st.ends_word = b.chars ? b.ends_word : a.ends_word;
  return st;
}

void Rope::recalc(Node* n) {
  if (!n || n->is_leaf()) return;
  n->stats = combine(n->left->stats, n->right->stats);
  n->height = 1 + std::max(node_height(n->left.get()), node_height(n->right.get()));
}

Rope::NodePtr Rope::rotate_left(NodePtr x) {
  auto y = std::move(x->right);
  auto T2 = std::move(y->left);
  y->left = std::move(x);
  y->left->right = std::move(T2);
  recalc(y->left.get());
  recalc(y.get());
  return y;
}

Rope::NodePtr Rope::rotate_right(NodePtr y) {
  auto x = std::move(y->left);
  auto T2 = std::move(x->right);
  x->right = std::move(y);
  x->right->left = std::move(T2);
  recalc(x->right.get());
  recalc(x.get());
  return x;
}

Rope::NodePtr Rope::balance(NodePtr n) {
  if (!n) return n;
  recalc(n.get());
  int bf = balance_factor(n.get());
  if (bf > 1) { // left heavy
    if (balance_factor(n->left.get()) < 0) {
      n->left = rotate_left(std::move(n->left));
    }
    return rotate_right(std::move(n));
  } else if (bf < -1) { // right heavy
    if (balance_factor(n->right.get()) > 0) {
      n->right = rotate_right(std::move(n->right));
    }
    return rotate_left(std::move(n));
  }
  return n;
}

Rope::NodePtr Rope::make_leaf(std::u32string&& text) {
  auto n = std::make_unique<Node>();
  n->text = std::move(text);
  n->stats = leaf_stats(n->text);
  return n;
}

Rope::NodePtr Rope::make_internal(NodePtr a, NodePtr b) {
  auto p = std::make_unique<Node>();
  p->left = std::move(a);
  p->right = std::move(b);
  recalc(p.get());
  return p;
}

Rope::NodePtr Rope::join(NodePtr a, NodePtr b) {
  if (!a) return b;
  if (!b) return a;
  if (a->is_leaf() && b->is_leaf() && a->text.size() + b->text.size() <= LEAF_MAX) {
    a->text += b->text;
    a->stats = combine(a->stats, b->stats);
    return a;
  }
  int ha = a->height, hb = b->height;
  if (ha > hb + 1) {
    a->right = join(std::move(a->right), std::move(b));
    return balance(std::move(a));
  }
  if (hb > ha + 1) {
    b->left = join(std::move(a), std::move(b->left));
    return balance(std::move(b));
  }
  return make_internal(std::move(a), std::move(b));
}

std::pair<Rope::NodePtr, Rope::NodePtr> Rope::split(NodePtr n, size_t k) {
  if (!n) return {nullptr, nullptr};
  if (k == 0) return {nullptr, std::move(n)};
  if (k >= n->stats.chars) return {std::move(n), nullptr};
  if (n->is_leaf()) {
    std::u32string right_text = n->text.substr(k);
    n->text.resize(k);
    n->stats = leaf_stats(n->text);
    return {std::move(n), make_leaf(std::move(right_text))};
  }
  size_t left_count = node_chars(n->left.get());
  NodePtr left = std::move(n->left);
  NodePtr right = std::move(n->right);
  if (k < left_count) {
    auto [a, b] = split(std::move(left), k);
    return {std::move(a), join(std::move(b), std::move(right))};
  }
  if (k == left_count) return {std::move(left), std::move(right)};
  auto [a, b] = split(std::move(right), k - left_count);
  return {join(std::move(left), std::move(a)), std::move(b)};
}

std::vector<std::u32string> Rope::chunk(std::u32string_view text) {
  std::vector<std::u32string> out;
  out.reserve(text.size() / LEAF_MAX + 1);
  for (size_t i = 0; i < text.size(); i += LEAF_MAX) {
    out.emplace_back(text.substr(i, std::min(LEAF_MAX, text.size() - i)));
  }
  return out;
}

Rope::NodePtr Rope::build_balanced(std::vector<std::u32string>& chunks, size_t l, size_t r) {
  size_t len = r - l;
  if (len == 0) return nullptr;
  if (len == 1) return make_leaf(std::move(chunks[l]));
  size_t mid = l + len / 2;
  auto left = build_balanced(chunks, l, mid);
  auto right = build_balanced(chunks, mid, r);
  return join(std::move(left), std::move(right));
}

Rope::NodePtr Rope::build_balanced_parallel(std::vector<std::u32string>& chunks, size_t l, size_t r) {
  size_t len = r - l;
  if (len <= PARALLEL_MIN_CHUNKS) return build_balanced(chunks, l, r);
  size_t mid = l + len / 2;
  auto fut_left = std::async(std::launch::async, [&]{ return build_balanced(chunks, l, mid); });
  auto right = build_balanced(chunks, mid, r);
  auto left = fut_left.get();
  return join(std::move(left), std::move(right));
}

Rope::NodePtr Rope::build(std::u32string_view text) {
  auto chunks = chunk(text);
  return build_balanced_parallel(chunks, 0, chunks.size());
}

void Rope::assign(std::u32string_view text) { root_ = build(text); }

void Rope::insert(size_t offset, std::u32string_view text) {
  if (offset > length()) throw InvalidPosition("rope insert at " + std::to_string(offset));
  if (text.empty()) return;
  auto [a, b] = split(std::move(root_), offset);
  root_ = join(join(std::move(a), build(text)), std::move(b));
}

void Rope::erase(size_t start, size_t end) {
  if (start > end || end > length()) {
    throw InvalidPosition("rope erase " + std::to_string(start) + ".." + std::to_string(end));
  }
  if (start == end) return;
  auto [a, rest] = split(std::move(root_), start);
  auto [mid, b] = split(std::move(rest), end - start);
  root_ = join(std::move(a), std::move(b));
}

char32_t Rope::char_at(size_t offset) const {
  if (offset >= length()) throw InvalidPosition("rope char_at " + std::to_string(offset));
  const Node* cur = root_.get();
  size_t idx = offset;
  while (!cur->is_leaf()) {
    size_t lc = node_chars(cur->left.get());
    if (idx < lc) { cur = cur->left.get(); continue; }
    idx -= lc;
    cur = cur->right.get();
  }
  return cur->text[idx];
}

void Rope::slice_into(const Node* n, size_t start, size_t end, std::u32string& out) {
  if (!n || start >= end) return;
  if (n->is_leaf()) { out.append(n->text, start, end - start); return; }
  size_t lc = node_chars(n->left.get());
  if (start < lc) slice_into(n->left.get(), start, std::min(end, lc), out);
  if (end > lc) slice_into(n->right.get(), start > lc ? start - lc : 0, end - lc, out);
}

std::u32string Rope::slice(size_t start, size_t end) const {
  if (start > end || end > length()) {
    throw InvalidPosition("rope slice " + std::to_string(start) + ".." + std::to_string(end));
  }
  std::u32string out;
  out.reserve(end - start);
  slice_into(root_.get(), start, end, out);
  return out;
}

size_t Rope::line_start(size_t line) const {
  if (line == 0) return 0;
  if (line > newline_count()) throw InvalidPosition("rope line " + std::to_string(line));
  const Node* cur = root_.get();
  size_t k = line; /* find the k-th newline */
  size_t base = 0;
  while (!cur->is_leaf()) {
    size_t ln = cur->left->stats.newlines;
    if (k <= ln) { cur = cur->left.get(); continue; }
    k -= ln;
    base += cur->left->stats.chars;
    cur = cur->right.get();
  }
  for (size_t i = 0; i < cur->text.size(); ++i) {
    if (cur->text[i] == U'\n' && --k == 0) return base + i + 1;
  }
  throw InvalidPosition("rope line index out of sync");
}

size_t Rope::newlines_before(size_t offset) const {
  if (offset > length()) throw InvalidPosition("rope offset " + std::to_string(offset));
  const Node* cur = root_.get();
  size_t idx = offset;
  size_t count = 0;
  while (cur && !cur->is_leaf()) {
    size_t lc = node_chars(cur->left.get());
    if (idx <= lc) { cur = cur->left.get(); continue; }
    idx -= lc;
    count += cur->left->stats.newlines;
    cur = cur->right.get();
  }
  if (cur) count += static_cast<size_t>(std::count(cur->text.begin(), cur->text.begin() + static_cast<std::ptrdiff_t>(idx), U'\n'));
  return count;
}

bool Rope::check_node(const Node* n) {
  if (n->is_leaf()) {
    if (n->text.empty() || n->text.size() > LEAF_MAX || n->height != 1) return false;
    Stats st = leaf_stats(n->text);
    return st.chars == n->stats.chars && st.newlines == n->stats.newlines && st.words == n->stats.words;
  }
  if (!n->left || !n->right) return false;
  if (!check_node(n->left.get()) || !check_node(n->right.get())) return false;
  if (std::abs(balance_factor(n)) > 1) return false;
  Stats st = combine(n->left->stats, n->right->stats);
  return st.chars == n->stats.chars && st.newlines == n->stats.newlines && st.words == n->stats.words &&
         n->height == 1 + std::max(n->left->height, n->right->height);
}

bool Rope::check_invariants() const { return !root_ || check_node(root_.get()); }
