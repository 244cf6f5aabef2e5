#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file reads via mmap and all-or-nothing writes.
 * Writes: .tmp sibling → write loop → fsync/fdatasync → atomic rename.
 * Usage: read_file(path, out, msg); returns IoError with msg on failure.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "posix_fd.hpp"
#include "types.hpp"

Status read_file(const std::filesystem::path& path, std::string& out, std::string& msg);

/* CRLF and lone CR become LF */
std::string normalize_newlines(std::string_view s);

/* split on '\n'; a trailing newline does not start an extra line, '\r' before '\n' is dropped */
std::vector<std::string> split_lines(std::string_view s);

/* byte-identical copy of `from` at `to` */
Status copy_file_bytes(const std::filesystem::path& from, const std::filesystem::path& to, std::string& msg);

class AtomicFileWriter {
public:
  explicit AtomicFileWriter(std::filesystem::path path);
  ~AtomicFileWriter();
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  Status open(std::string& msg);
  Status write(std::string_view data, std::string& msg);
  /* sync, close and rename over the target */
  Status commit(std::string& msg);

private:
  std::filesystem::path path_;
  std::filesystem::path tmp_;
  UniqueFd fd_;
  bool opened_ = false;     /* the .tmp is ours to clean up */
  bool committed_ = false;
};

Status write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg);
