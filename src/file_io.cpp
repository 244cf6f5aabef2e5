#include "file_io.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

Status read_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string() + ": " + std::strerror(errno); return Status::IoError; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return Status::IoError; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return Status::IoError; }
  MappedFile map(fd.get(), static_cast<size_t>(st.st_size));
  if (!map.valid()) { msg = std::string("can not mmap file: ") + path.string(); return Status::IoError; }
  map.advise_sequential();
  out.assign(map.view());
  msg = std::string("opened file: ") + path.string();
  return Status::Ok;
}

std::string normalize_newlines(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::vector<std::string> split_lines(std::string_view s) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\n') {
      size_t end = i;
      if (end > start && s[end - 1] == '\r') end--;
      lines.emplace_back(s.substr(start, end - start));
      start = i + 1;
    }
  }
  if (start < s.size()) {
    size_t end = s.size();
    if (end > start && s[end - 1] == '\r') end--;
    lines.emplace_back(s.substr(start, end - start));
  }
  return lines;
}

Status copy_file_bytes(const std::filesystem::path& from, const std::filesystem::path& to, std::string& msg) {
  std::string data;
  if (read_file(from, data, msg) != Status::Ok) return Status::IoError;
  return write_file_atomic(to, data, msg);
}

AtomicFileWriter::AtomicFileWriter(std::filesystem::path path) : path_(std::move(path)) {
  tmp_ = path_;
  tmp_ += ".tmp";
}

AtomicFileWriter::~AtomicFileWriter() {
  if (opened_ && !committed_) {
    fd_.reset();
    std::error_code ec;
    std::filesystem::remove(tmp_, ec);
  }
}

Status AtomicFileWriter::open(std::string& msg) {
  fd_.reset(::open(tmp_.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!fd_.valid()) {
    msg = std::string("write file failed: ") + tmp_.string() + ": " + std::strerror(errno);
    return Status::IoError;
  }
  opened_ = true;
  return Status::Ok;
}

Status AtomicFileWriter::write(std::string_view data, std::string& msg) {
  const char* p = data.data();
  size_t remain = data.size();
  while (remain > 0) {
    ssize_t w = ::write(fd_.get(), p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      msg = std::string("write file failed: ") + tmp_.string() + ": " + std::strerror(errno);
      return Status::IoError;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
  return Status::Ok;
}

Status AtomicFileWriter::commit(std::string& msg) {
#if defined(__APPLE__)
  if (::fsync(fd_.get()) != 0) { msg = std::string("write file failed: ") + tmp_.string(); return Status::IoError; }
#else
  if (::fdatasync(fd_.get()) != 0) { msg = std::string("write file failed: ") + tmp_.string(); return Status::IoError; }
#endif
  if (::close(fd_.release()) != 0) { msg = std::string("write file failed: ") + tmp_.string(); return Status::IoError; }
  std::error_code ec;
  std::filesystem::rename(tmp_, path_, ec);
  if (ec) { msg = std::string("write file failed: ") + path_.string() + ": " + ec.message(); return Status::IoError; }
  committed_ = true;
  msg = std::string("saved file: ") + path_.string();
  return Status::Ok;
}

Status write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg) {
  AtomicFileWriter w(path);
  if (w.open(msg) != Status::Ok) return Status::IoError;
  if (w.write(data, msg) != Status::Ok) return Status::IoError;
  return w.commit(msg);
}
