#include "version_store.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <zlib.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include "file_io.hpp"
#include "posix_fd.hpp"
#include "utf8.hpp"

static constexpr char MAGIC[4] = {'S', 'C', 'V', 'R'};
static constexpr size_t HEADER_SIZE = 4 + 8 + 8 + 4 + 4;
static constexpr size_t PREVIEW_CHARS = 50;
static constexpr size_t DIFF_MAX_CELLS = 4u << 20;

static void put_u32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

static void put_u64(std::string& out, uint64_t v) {
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

static uint32_t get_u32(const char* p) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(p[i]);
  return v;
}

static uint64_t get_u64(const char* p) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(p[i]);
  return v;
}

static uint32_t payload_crc(const char* p, size_t n) {
  uLong crc = crc32(0L, Z_NULL, 0);
  return static_cast<uint32_t>(crc32(crc, reinterpret_cast<const Bytef*>(p), static_cast<uInt>(n)));
}

static uint64_t fnv1a64(const std::string& s) {
  uint64_t h = 1469598103934665603ull;
  for (unsigned char c : s) { h ^= c; h *= 1099511628211ull; }
  return h;
}

static std::string doc_key(const std::filesystem::path& doc) {
  std::error_code ec;
  auto p = std::filesystem::weakly_canonical(doc, ec);
  if (!ec) return p.string();
  p = std::filesystem::absolute(doc, ec);
  if (!ec) return p.lexically_normal().string();
  return doc.lexically_normal().string();
}

static int64_t system_now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static bool write_all(int fd, const std::string& data) {
  const char* p = data.data();
  size_t remain = data.size();
  while (remain > 0) {
    ssize_t w = ::write(fd, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
  return true;
}

Status deflate_text(const std::string& in, std::string& out) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) return Status::IoError;
  out.resize(deflateBound(&zs, static_cast<uLong>(in.size())));
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  int rc = deflate(&zs, Z_FINISH);
  size_t n = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) { out.clear(); return Status::IoError; }
  out.resize(n);
  return Status::Ok;
}

Status inflate_text(const std::string& in, std::string& out) {
  out.clear();
  z_stream zs{};
  if (inflateInit2(&zs, -15) != Z_OK) return Status::IoError;
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  char chunk[1 << 15];
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef*>(chunk);
    zs.avail_out = sizeof(chunk);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) break;
    out.append(chunk, sizeof(chunk) - zs.avail_out);
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) { rc = Z_DATA_ERROR; break; }
  }
  inflateEnd(&zs);
  if (rc != Z_STREAM_END) { out.clear(); return Status::VersionRecordCorrupt; }
  return Status::Ok;
}

std::string format_timestamp(int64_t timestamp_ms) {
  std::time_t t = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
  return std::string(buf, n);
}

std::string version_preview(const std::string& content) {
  std::u32string s = utf8_decode(content);
  bool cut = s.size() > PREVIEW_CHARS;
  std::u32string head = s.substr(0, PREVIEW_CHARS);
  for (char32_t& c : head) if (c == U'\n') c = U' ';
  size_t b = 0, e = head.size();
  while (b < e && is_space_char(head[b])) ++b;
  while (e > b && is_space_char(head[e - 1])) --e;
  std::string out = utf8_encode(head.substr(b, e - b));
  if (cut) out += "...";
  return out;
}

VersionStore::VersionStore(std::filesystem::path dir, size_t max_versions, NowFn now)
  : dir_(std::move(dir)), max_versions_(std::max<size_t>(max_versions, 1)), now_(std::move(now)) {
  if (!now_) now_ = system_now_ms;
}

std::filesystem::path VersionStore::log_path(const std::filesystem::path& doc) const {
  char name[32];
  std::snprintf(name, sizeof(name), "%016llx.log", static_cast<unsigned long long>(fnv1a64(doc_key(doc))));
  return dir_ / name;
}

std::vector<std::string> VersionStore::take_warnings() {
  std::vector<std::string> out;
  out.swap(warnings_);
  return out;
}

void VersionStore::scan(const std::filesystem::path& file, const std::string& data, std::vector<VersionRecord>& out) {
  std::string_view view(data);
  std::string_view magic(MAGIC, sizeof(MAGIC));
  auto skipped = [&](size_t at, const char* why) {
    warnings_.push_back("version log " + file.filename().string() + ": skipped " + why + " at offset " + std::to_string(at));
  };
  size_t p = 0;
  while (p < view.size()) {
    if (view.size() - p < HEADER_SIZE) { skipped(p, "truncated record"); break; }
    if (view.substr(p, 4) != magic) {
      skipped(p, "unrecognized bytes");
      size_t next = view.find(magic, p + 1);
      if (next == std::string_view::npos) break;
      p = next;
      continue;
    }
    const char* h = data.data() + p;
    VersionRecord rec;
    rec.timestamp_ms = static_cast<int64_t>(get_u64(h + 4));
    rec.word_count = get_u64(h + 12);
    rec.payload_len = get_u32(h + 20);
    rec.crc = get_u32(h + 24);
    rec.offset = p;
    bool ok = rec.payload_len <= view.size() - p - HEADER_SIZE &&
              payload_crc(h + HEADER_SIZE, rec.payload_len) == rec.crc;
    if (!ok) {
      skipped(p, "corrupt record");
      size_t next = view.find(magic, p + 1);
      if (next == std::string_view::npos) break;
      p = next;
      continue;
    }
    out.push_back(rec);
    p += HEADER_SIZE + rec.payload_len;
  }
}

Status VersionStore::open_log(const std::filesystem::path& doc, Log*& out, std::string& msg) {
  std::string key = doc_key(doc);
  auto it = logs_.find(key);
  if (it != logs_.end()) { out = &it->second; return Status::Ok; }
  Log log;
  auto file = log_path(doc);
  std::error_code ec;
  if (std::filesystem::exists(file, ec)) {
    std::string data;
    if (read_file(file, data, msg) != Status::Ok) return Status::IoError;
    scan(file, data, log.index);
  }
  out = &logs_.emplace(key, std::move(log)).first->second;
  return Status::Ok;
}

Status VersionStore::record(const std::filesystem::path& doc, const std::string& content, std::string& msg) {
  Log* log = nullptr;
  if (open_log(doc, log, msg) != Status::Ok) return Status::IoError;
  int64_t ts = now_();
  if (!log->index.empty()) ts = std::max(ts, log->index.back().timestamp_ms + 1);
  std::string payload;
  if (deflate_text(content, payload) != Status::Ok) { msg = "version compress failed"; return Status::IoError; }

  VersionRecord rec;
  rec.timestamp_ms = ts;
  rec.word_count = count_words(content);
  rec.payload_len = static_cast<uint32_t>(payload.size());
  rec.crc = payload_crc(payload.data(), payload.size());
  std::string bytes(MAGIC, sizeof(MAGIC));
  put_u64(bytes, static_cast<uint64_t>(rec.timestamp_ms));
  put_u64(bytes, rec.word_count);
  put_u32(bytes, rec.payload_len);
  put_u32(bytes, rec.crc);
  bytes += payload;

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) { msg = "can not create version dir: " + dir_.string() + ": " + ec.message(); return Status::IoError; }
  auto file = log_path(doc);
  UniqueFd fd(::open(file.string().c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644));
  if (!fd.valid()) { msg = "can not open version log: " + file.string() + ": " + std::strerror(errno); return Status::IoError; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not stat version log: " + file.string(); return Status::IoError; }
  rec.offset = static_cast<uint64_t>(st.st_size);
  if (!write_all(fd.get(), bytes)) { msg = "write version log failed: " + file.string(); return Status::IoError; }
#if defined(__APPLE__)
  if (::fsync(fd.get()) != 0) { msg = "write version log failed: " + file.string(); return Status::IoError; }
#else
  if (::fdatasync(fd.get()) != 0) { msg = "write version log failed: " + file.string(); return Status::IoError; }
#endif
  fd.reset();
  log->index.push_back(rec);
  if (log->index.size() > max_versions_) return evict(file, *log, msg);
  msg = "version saved";
  return Status::Ok;
}

Status VersionStore::evict(const std::filesystem::path& file, Log& log, std::string& msg) {
  std::string data;
  if (read_file(file, data, msg) != Status::Ok) return Status::IoError;
  size_t drop = log.index.size() - max_versions_;
  std::vector<VersionRecord> kept;
  std::string compacted;
  for (size_t i = drop; i < log.index.size(); ++i) {
    VersionRecord rec = log.index[i];
    size_t len = HEADER_SIZE + rec.payload_len;
    if (rec.offset + len > data.size()) {
      msg = "version log changed underneath: " + file.string();
      return Status::IoError;
    }
    size_t at = compacted.size();
    compacted.append(data, rec.offset, len);
    rec.offset = at;
    kept.push_back(rec);
  }
  if (write_file_atomic(file, compacted, msg) != Status::Ok) return Status::IoError;
  log.index = std::move(kept);
  msg = "version saved";
  return Status::Ok;
}

Status VersionStore::records(const std::filesystem::path& doc, std::vector<VersionRecord>& out, std::string& msg) {
  out.clear();
  Log* log = nullptr;
  if (open_log(doc, log, msg) != Status::Ok) return Status::IoError;
  out = log->index;
  return Status::Ok;
}

Status VersionStore::load(const std::filesystem::path& doc, int64_t timestamp_ms, std::string& content, std::string& msg) {
  Log* log = nullptr;
  if (open_log(doc, log, msg) != Status::Ok) return Status::IoError;
  auto it = std::find_if(log->index.begin(), log->index.end(),
                         [&](const VersionRecord& r) { return r.timestamp_ms == timestamp_ms; });
  if (it == log->index.end()) { msg = "no such version: " + std::to_string(timestamp_ms); return Status::InvalidPosition; }
  auto file = log_path(doc);
  UniqueFd fd(::open(file.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open version log: " + file.string(); return Status::IoError; }
  std::string bytes(HEADER_SIZE + it->payload_len, '\0');
  ssize_t n = ::pread(fd.get(), bytes.data(), bytes.size(), static_cast<off_t>(it->offset));
  if (n != static_cast<ssize_t>(bytes.size()) || bytes.compare(0, 4, MAGIC, 4) != 0 ||
      payload_crc(bytes.data() + HEADER_SIZE, it->payload_len) != it->crc) {
    msg = "version record corrupt: " + format_timestamp(timestamp_ms);
    warnings_.push_back(msg);
    return Status::VersionRecordCorrupt;
  }
  Status st = inflate_text(bytes.substr(HEADER_SIZE), content);
  if (st != Status::Ok) {
    msg = "version record corrupt: " + format_timestamp(timestamp_ms);
    warnings_.push_back(msg);
    return Status::VersionRecordCorrupt;
  }
  return Status::Ok;
}

bool VersionStore::content_differs(const std::filesystem::path& doc, const std::string& content) {
  std::string msg;
  Log* log = nullptr;
  if (open_log(doc, log, msg) != Status::Ok || log->index.empty()) return true;
  std::string latest;
  if (load(doc, log->index.back().timestamp_ms, latest, msg) != Status::Ok) return true;
  return latest != content;
}

Status VersionStore::restore(const std::filesystem::path& doc, int64_t timestamp_ms, TextBuffer& buf, UndoManager& um,
                             std::string& msg) {
  std::string target;
  Status st = load(doc, timestamp_ms, target, msg);
  if (st != Status::Ok) return st;
  if (record(doc, buf.text(), msg) != Status::Ok) {
    msg = "restore aborted, can not snapshot current text: " + msg;
    return Status::IoError;
  }
  buf.set_text(target);
  um.clear();
  msg = "restored version from " + format_timestamp(timestamp_ms);
  return Status::Ok;
}

/* Rust-style lines(): no trailing empty line, "\r\n" treated as "\n" */
static std::vector<std::string> diff_split(const std::string& s) { return split_lines(s); }

namespace {
/* coalesces ops into runs; inside a change block deletes are emitted before inserts */
struct RunBuilder {
  std::vector<DiffRun> runs;
  std::vector<std::string> del, ins;

  void push(DiffOp op, const std::string& line) {
    if (runs.empty() || runs.back().op != op) runs.push_back(DiffRun{op, {}});
    runs.back().lines.push_back(line);
  }
  void flush() {
    for (const auto& l : del) push(DiffOp::Delete, l);
    for (const auto& l : ins) push(DiffOp::Insert, l);
    del.clear();
    ins.clear();
  }
  void equal(const std::string& l) { flush(); push(DiffOp::Equal, l); }
};
}

std::vector<DiffRun> diff_lines(const std::string& a, const std::string& b) {
  auto x = diff_split(a);
  auto y = diff_split(b);
  size_t pre = 0;
  while (pre < x.size() && pre < y.size() && x[pre] == y[pre]) ++pre;
  size_t suf = 0;
  while (suf < x.size() - pre && suf < y.size() - pre && x[x.size() - 1 - suf] == y[y.size() - 1 - suf]) ++suf;

  RunBuilder rb;
  for (size_t i = 0; i < pre; ++i) rb.equal(x[i]);

  size_t n = x.size() - pre - suf;
  size_t m = y.size() - pre - suf;
  if (n > 0 && m > 0 && (n + 1) * (m + 1) <= DIFF_MAX_CELLS) {
    /* L[i][j] = LCS length of x[pre+i..] and y[pre+j..] */
    std::vector<uint32_t> L((n + 1) * (m + 1), 0);
    auto at = [&](size_t i, size_t j) -> uint32_t& { return L[i * (m + 1) + j]; };
    for (size_t i = n; i-- > 0;) {
      for (size_t j = m; j-- > 0;) {
        if (x[pre + i] == y[pre + j]) at(i, j) = at(i + 1, j + 1) + 1;
        else at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
      }
    }
    size_t i = 0, j = 0;
    while (i < n || j < m) {
      if (i < n && j < m && x[pre + i] == y[pre + j]) {
        rb.equal(x[pre + i]); ++i; ++j;
      } else if (i < n && (j == m || at(i + 1, j) >= at(i, j + 1))) {
        rb.del.push_back(x[pre + i]); ++i;
      } else {
        rb.ins.push_back(y[pre + j]); ++j;
      }
    }
  } else {
    /* one side empty, or too large for the table: replace the middle wholesale */
    for (size_t i = 0; i < n; ++i) rb.del.push_back(x[pre + i]);
    for (size_t j = 0; j < m; ++j) rb.ins.push_back(y[pre + j]);
  }

  for (size_t i = x.size() - suf; i < x.size(); ++i) rb.equal(x[i]);
  rb.flush();
  return std::move(rb.runs);
}

std::vector<std::string> format_diff(const std::vector<DiffRun>& runs) {
  std::vector<std::string> out;
  for (const auto& r : runs) {
    const char* prefix = r.op == DiffOp::Equal ? "  " : r.op == DiffOp::Insert ? "+ " : "- ";
    for (const auto& l : r.lines) out.push_back(prefix + l);
  }
  return out;
}
