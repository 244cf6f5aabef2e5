#pragma once
/*
 * VersionStore
 *
 * Purpose: per-document history of saved snapshots, kept as an append-only
 * log plus an in-memory index built on first access.
 * Record layout (little endian):
 *   "SCVR" | i64 timestamp_ms | u64 word_count | u32 payload_len | u32 crc32 | payload
 * Payload is raw DEFLATE of the UTF-8 content; crc32 covers the payload.
 * A bad record is skipped by scanning forward to the next magic; the log is
 * never rejected as a whole.
 */
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "text_buffer.hpp"
#include "types.hpp"
#include "undo_manager.hpp"

struct VersionRecord {
  int64_t timestamp_ms = 0; /* unique per document, strictly increasing */
  uint64_t word_count = 0;
  uint64_t offset = 0;      /* of the record header inside the log */
  uint32_t payload_len = 0;
  uint32_t crc = 0;
};

class VersionStore {
public:
  using NowFn = std::function<int64_t()>;

  VersionStore(std::filesystem::path dir, size_t max_versions, NowFn now = {});

  Status record(const std::filesystem::path& doc, const std::string& content, std::string& msg);
  /* oldest first */
  Status records(const std::filesystem::path& doc, std::vector<VersionRecord>& out, std::string& msg);
  Status load(const std::filesystem::path& doc, int64_t timestamp_ms, std::string& content, std::string& msg);
  /* true when there is no readable latest version or it differs from content */
  bool content_differs(const std::filesystem::path& doc, const std::string& content);
  /* snapshot the live content, then replace it with the chosen version and reset undo */
  Status restore(const std::filesystem::path& doc, int64_t timestamp_ms, TextBuffer& buf, UndoManager& um,
                 std::string& msg);

  std::filesystem::path log_path(const std::filesystem::path& doc) const;
  std::vector<std::string> take_warnings();

private:
  struct Log {
    std::vector<VersionRecord> index;
  };

  std::filesystem::path dir_;
  size_t max_versions_;
  NowFn now_;
  std::unordered_map<std::string, Log> logs_;
  std::vector<std::string> warnings_;

  Status open_log(const std::filesystem::path& doc, Log*& out, std::string& msg);
  void scan(const std::filesystem::path& file, const std::string& data, std::vector<VersionRecord>& out);
  Status evict(const std::filesystem::path& file, Log& log, std::string& msg);
};

Status deflate_text(const std::string& in, std::string& out);
Status inflate_text(const std::string& in, std::string& out);

/* local "YYYY-MM-DD HH:MM" */
std::string format_timestamp(int64_t timestamp_ms);
/* first 50 characters, newlines as spaces, trimmed, "..." when cut */
std::string version_preview(const std::string& content);

enum class DiffOp { Equal, Insert, Delete };

struct DiffRun {
  DiffOp op = DiffOp::Equal;
  std::vector<std::string> lines;
};

/* minimal line edit script from a to b (LCS); deletes precede inserts in a hunk */
std::vector<DiffRun> diff_lines(const std::string& a, const std::string& b);
/* "  ", "+ ", "- " prefixed lines */
std::vector<std::string> format_diff(const std::vector<DiffRun>& runs);
