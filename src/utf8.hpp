#pragma once
/*
 * Utf8
 *
 * Purpose: UTF-8 <-> code point conversion and character classes used by
 * word counting, word motions and case-insensitive search.
 * Note: invalid sequences decode to U+FFFD, one per offending byte.
 */
#include <string>
#include <string_view>

std::u32string utf8_decode(std::string_view s);
std::string utf8_encode(std::u32string_view s);
void utf8_append(std::string& out, char32_t c);
size_t utf8_length(std::string_view s);

bool is_space_char(char32_t c);
bool is_word_char(char32_t c);
char32_t fold_case(char32_t c);

/* terminal cells: 0 for combining marks, 2 for East Asian wide and emoji, else 1.
   Table based so the result does not depend on the process locale. */
int char_width(char32_t c);
size_t display_width(std::u32string_view s);

/* whitespace-delimited token count */
size_t count_words(std::string_view s);
size_t count_words(std::u32string_view s);
