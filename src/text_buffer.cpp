#include "text_buffer.hpp"
#include <vector>
#include "config.hpp"
#include "file_io.hpp"
#include "utf8.hpp"

static void check_range(Range r, size_t len, const char* op) {
  if (r.start > r.end || r.end > len) {
    throw InvalidPosition(std::string(op) + ": range " + std::to_string(r.start) + ".." + std::to_string(r.end) +
                          " outside 0.." + std::to_string(len));
  }
}

TextBuffer::TextBuffer(std::string_view utf8) : rope_(utf8_decode(utf8)) {}

std::string TextBuffer::insert(size_t offset, std::string_view text) {
  if (offset > length()) {
    throw InvalidPosition("insert: offset " + std::to_string(offset) + " outside 0.." + std::to_string(length()));
  }
  std::u32string s = utf8_decode(text);
  rope_.insert(offset, s);
  return utf8_encode(s);
}

std::string TextBuffer::erase(Range r) {
  check_range(r, length(), "erase");
  std::string removed = utf8_encode(rope_.slice(r.start, r.end));
  rope_.erase(r.start, r.end);
  return removed;
}

std::string TextBuffer::slice(Range r) const { return utf8_encode(slice32(r)); }

std::u32string TextBuffer::slice32(Range r) const {
  check_range(r, length(), "slice");
  return rope_.slice(r.start, r.end);
}

char32_t TextBuffer::char_at(size_t offset) const {
  if (offset >= length()) {
    throw InvalidPosition("char_at: offset " + std::to_string(offset) + " outside 0.." + std::to_string(length()));
  }
  return rope_.char_at(offset);
}

Range TextBuffer::line_range(size_t line) const {
  if (line >= line_count()) {
    throw InvalidPosition("line " + std::to_string(line) + " outside 0.." + std::to_string(line_count()));
  }
  size_t start = rope_.line_start(line);
  size_t end = (line + 1 < line_count()) ? rope_.line_start(line + 1) - 1 : length();
  return {start, end};
}

LineCol TextBuffer::offset_to_line_col(size_t offset) const {
  if (offset > length()) {
    throw InvalidPosition("offset " + std::to_string(offset) + " outside 0.." + std::to_string(length()));
  }
  size_t line = rope_.newlines_before(offset);
  return {line, offset - rope_.line_start(line)};
}

size_t TextBuffer::line_col_to_offset(size_t line, size_t col) const {
  Range r = line_range(line);
  if (col > r.size()) {
    throw InvalidPosition("column " + std::to_string(col) + " past end of line " + std::to_string(line));
  }
  return r.start + col;
}

std::string TextBuffer::text() const { return utf8_encode(rope_.to_u32string()); }

void TextBuffer::set_text(std::string_view utf8) { rope_.assign(utf8_decode(utf8)); }

Status TextBuffer::load_file(const std::filesystem::path& path, std::string& msg) {
  std::string data;
  if (read_file(path, data, msg) != Status::Ok) return Status::IoError;
  set_text(normalize_newlines(data));
  return Status::Ok;
}

Status TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  AtomicFileWriter w(path);
  if (w.open(msg) != Status::Ok) return Status::IoError;
  std::string buf;
  buf.reserve(static_cast<size_t>(SCRIBE_WRITE_CHUNK_SIZE) + 4);
  Status st = Status::Ok;
  rope_.for_each_chunk([&](std::u32string_view chunk) {
    if (st != Status::Ok) return;
    for (char32_t c : chunk) {
      utf8_append(buf, c);
      if (buf.size() >= static_cast<size_t>(SCRIBE_WRITE_CHUNK_SIZE)) {
        st = w.write(buf, msg);
        buf.clear();
        if (st != Status::Ok) return;
      }
    }
  });
  if (st != Status::Ok) return st;
  if (!buf.empty() && w.write(buf, msg) != Status::Ok) return Status::IoError;
  return w.commit(msg);
}
