#include "utf8.hpp"
#include <cwctype>

static constexpr char32_t REPLACEMENT = 0xFFFD;

static size_t decode_one(std::string_view s, size_t i, char32_t& out) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) { out = c; return 1; }
  size_t need = 0;
  char32_t cp = 0;
  if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; }
  else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; }
  else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; }
  else { out = REPLACEMENT; return 1; }
  if (i + need >= s.size()) { out = REPLACEMENT; return 1; }
  for (size_t k = 1; k <= need; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) { out = REPLACEMENT; return 1; }
    cp = (cp << 6) | (cc & 0x3F);
  }
  static constexpr char32_t min_for[4] = {0, 0x80, 0x800, 0x10000};
  if (cp < min_for[need] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { out = REPLACEMENT; return 1; }
  out = cp;
  return need + 1;
}

std::u32string utf8_decode(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    char32_t c;
    i += decode_one(s, i, c);
    out.push_back(c);
  }
  return out;
}

void utf8_append(std::string& out, char32_t c) {
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

std::string utf8_encode(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t c : s) utf8_append(out, c);
  return out;
}

size_t utf8_length(std::string_view s) {
  size_t n = 0, i = 0;
  while (i < s.size()) {
    char32_t c;
    i += decode_one(s, i, c);
    ++n;
  }
  return n;
}

bool is_space_char(char32_t c) {
  if (c >= 0x09 && c <= 0x0D) return true;
  if (c == 0x20 || c == 0x85 || c == 0xA0 || c == 0x1680) return true;
  if (c >= 0x2000 && c <= 0x200A) return true;
  return c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

bool is_word_char(char32_t c) {
  if (c < 0x80) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }
  return !is_space_char(c);
}

char32_t fold_case(char32_t c) {
  if (c < 0x80) return (c >= 'A' && c <= 'Z') ? c + 32 : c;
  /* Latin-1, Greek and Cyrillic capitals fold the same in every locale */
  if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 32;
  if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) return c + 32;
  if (c >= 0x410 && c <= 0x42F) return c + 32;
  if (c >= 0x400 && c <= 0x40F) return c + 80;
  return static_cast<char32_t>(std::towlower(static_cast<wint_t>(c)));
}

struct CodeRange { char32_t lo, hi; };

static constexpr CodeRange ZERO_WIDTH[] = {
  {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A}, {0x064B, 0x065F},
  {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x0E47, 0x0E4E}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF},
  {0x200B, 0x200F}, {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
};

static constexpr CodeRange WIDE[] = {
  {0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},
  {0xA000, 0xA4CF}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE30, 0xFE4F}, {0xFF00, 0xFF60},
  {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F}, {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template <size_t N>
static bool in_table(const CodeRange (&table)[N], char32_t c) {
  for (const CodeRange& r : table) {
    if (c < r.lo) return false;
    if (c <= r.hi) return true;
  }
  return false;
}

int char_width(char32_t c) {
  if (c < 0x300) return 1;
  if (in_table(ZERO_WIDTH, c)) return 0;
  return in_table(WIDE, c) ? 2 : 1;
}

size_t display_width(std::u32string_view s) {
  size_t w = 0;
  for (char32_t c : s) w += (size_t)char_width(c);
  return w;
}

size_t count_words(std::u32string_view s) {
  size_t n = 0;
  bool in_word = false;
  for (char32_t c : s) {
    bool sp = is_space_char(c);
    if (!sp && !in_word) ++n;
    in_word = !sp;
  }
  return n;
}

size_t count_words(std::string_view s) { return count_words(utf8_decode(s)); }
