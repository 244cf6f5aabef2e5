#pragma once
/*
 * TextBuffer
 *
 * Purpose: the document. Code-point offsets over a Rope, UTF-8 at the edges.
 * Contract: offsets/ranges outside [0, length] throw InvalidPosition; nothing
 * is clamped here. Mutations return the exact text inserted/removed so the
 * caller can record an inverse delta.
 * Feature: safe writes (write .tmp → fsync/fdatasync → atomic rename).
 */
#include <filesystem>
#include <string>
#include <string_view>
#include "rope.hpp"
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer() = default;
  explicit TextBuffer(std::string_view utf8);

  size_t length() const { return rope_.length(); }
  bool empty() const { return rope_.length() == 0; }

  std::string insert(size_t offset, std::string_view text);
  std::string erase(Range r);
  std::string slice(Range r) const;
  std::u32string slice32(Range r) const;
  char32_t char_at(size_t offset) const;

  size_t line_count() const { return rope_.newline_count() + 1; }
  /* [start, end) of the line content, newline excluded */
  Range line_range(size_t line) const;
  std::string line(size_t line) const { return slice(line_range(line)); }
  size_t line_length(size_t line) const { return line_range(line).size(); }
  LineCol offset_to_line_col(size_t offset) const;
  size_t line_col_to_offset(size_t line, size_t col) const;

  size_t word_count() const { return rope_.word_count(); }

  std::string text() const;
  std::u32string text32() const { return rope_.to_u32string(); }
  void set_text(std::string_view utf8);

  /* whole-file read; CRLF/CR normalized to LF */
  Status load_file(const std::filesystem::path& path, std::string& msg);
  Status write_file(const std::filesystem::path& path, std::string& msg) const;

  const Rope& rope() const { return rope_; }

private:
  Rope rope_;
};
