#pragma once
/*
 * POSIX handles
 *
 * Purpose: move-only owners for a file descriptor and a read-only mmap region.
 * Note: both release on destruction; get()/data() stay valid until then.
 */
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
private:
  void close() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

class MappedRegion {
public:
  // Maps len bytes of fd read-only; valid() is false when mmap fails.
  MappedRegion(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) addr_ = p;
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() { if (addr_) ::munmap(addr_, len_); }
  bool valid() const { return addr_ != nullptr; }
  const char* data() const { return static_cast<const char*>(addr_); }
  size_t size() const { return len_; }
private:
  void* addr_ = nullptr;
  size_t len_;
};
