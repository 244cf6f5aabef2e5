#pragma once
/*
 * POSIX handles
 *
 * UniqueFd: owning file descriptor, closed on scope exit.
 * MappedFile: read-only private mapping of an open descriptor, unmapped on
 * scope exit. A zero-length file maps to an empty view.
 */
#include <sys/mman.h>
#include <unistd.h>
#include <cstddef>
#include <string_view>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
  /* hand ownership to the caller, e.g. to check close() */
  int release() { int fd = fd_; fd_ = -1; return fd; }
private:
  int fd_;
};

class MappedFile {
public:
  MappedFile(int fd, size_t len) : len_(len) {
    if (len_ == 0) return;
    void* p = ::mmap(nullptr, len_, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) addr_ = p;
  }
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { if (addr_) ::munmap(addr_, len_); }

  bool valid() const { return addr_ != nullptr || len_ == 0; }
  std::string_view view() const {
    return addr_ ? std::string_view(static_cast<const char*>(addr_), len_) : std::string_view();
  }
  /* sequential read-ahead hint; failure only costs speed */
  void advise_sequential() const { if (addr_) (void)::madvise(addr_, len_, MADV_SEQUENTIAL); }
private:
  void* addr_ = nullptr;
  size_t len_;
};
