#pragma once
/*
 * Rope
 *
 * Purpose: AVL-balanced chunked text store (code points) with O(log n)
 * insert/erase and offset<->line lookup.
 * Shape: leaves hold non-empty chunks of at most SCRIBE_ROPE_LEAF_MAX code
 * points; internal nodes hold no text and always have two children.
 * Aggregates (chars, newlines, words) are recomputed bottom-up on every
 * structural change, so line/word queries never rescan the document.
 */
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class Rope {
public:
  Rope() = default;
  explicit Rope(std::u32string_view text);
  Rope(Rope&&) noexcept = default;
  Rope& operator=(Rope&&) noexcept = default;
  Rope(const Rope&) = delete;
  Rope& operator=(const Rope&) = delete;

  size_t length() const { return root_ ? root_->stats.chars : 0; }
  size_t newline_count() const { return root_ ? root_->stats.newlines : 0; }
  size_t word_count() const { return root_ ? root_->stats.words : 0; }
  int height() const { return node_height(root_.get()); }

  void assign(std::u32string_view text);
  void insert(size_t offset, std::u32string_view text);
  void erase(size_t start, size_t end);

  char32_t char_at(size_t offset) const;
  std::u32string slice(size_t start, size_t end) const;
  std::u32string to_u32string() const { return slice(0, length()); }

  /* offset of the first code point of `line`; line must be <= newline_count() */
  size_t line_start(size_t line) const;
  /* number of '\n' in [0, offset) */
  size_t newlines_before(size_t offset) const;

  template <class F>
  void for_each_chunk(F&& f) const { walk_chunks(root_.get(), f); }

  /* AVL balance, aggregate consistency, leaf size limits */
  bool check_invariants() const;

private:
  struct Stats {
    size_t chars = 0;
    size_t newlines = 0;
    size_t words = 0;
    bool starts_word = false;
    bool ends_word = false;
  };
  struct Node {
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
    std::u32string text; /* non-empty only for leaves */
    Stats stats;
    int height = 1;
    bool is_leaf() const { return !left && !right; }
  };
  using NodePtr = std::unique_ptr<Node>;
  NodePtr root_;

  static int node_height(const Node* n) { return n ? n->height : 0; }
  static size_t node_chars(const Node* n) { return n ? n->stats.chars : 0; }
  static int balance_factor(const Node* n) { return n ? (node_height(n->left.get()) - node_height(n->right.get())) : 0; }
  static Stats leaf_stats(std::u32string_view s);
  static Stats combine(const Stats& a, const Stats& b);
  static void recalc(Node* n);
  static NodePtr rotate_left(NodePtr x);
  static NodePtr rotate_right(NodePtr y);
  static NodePtr balance(NodePtr n);

  static NodePtr make_leaf(std::u32string&& text);
  static NodePtr make_internal(NodePtr a, NodePtr b);
  static NodePtr join(NodePtr a, NodePtr b);
  static std::pair<NodePtr, NodePtr> split(NodePtr n, size_t k);
  static std::vector<std::u32string> chunk(std::u32string_view text);
  static NodePtr build_balanced(std::vector<std::u32string>& chunks, size_t l, size_t r);
  static NodePtr build_balanced_parallel(std::vector<std::u32string>& chunks, size_t l, size_t r);
  static NodePtr build(std::u32string_view text);
  static void slice_into(const Node* n, size_t start, size_t end, std::u32string& out);
  static bool check_node(const Node* n);

  template <class F>
  static void walk_chunks(const Node* n, F& f) {
    if (!n) return;
    if (n->is_leaf()) { f(std::u32string_view(n->text)); return; }
    walk_chunks(n->left.get(), f);
    walk_chunks(n->right.get(), f);
  }
};
