#include "csvlint/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace csvlint {

struct FileByteSource::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::string err;

  bool open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) {
      last_errno = errno;
      err = std::strerror(last_errno);
      return false;
    }
    return true;
  }

  bool read(char* dst, std::size_t cap, std::size_t& got) {
    got = 0;
    if (!f && !open()) return false;
    const std::size_t want = std::min(cap, cfg.chunk_bytes);
    std::size_t n = std::fread(dst, 1, want, f);
    if (n == 0 && std::ferror(f)) {
      last_errno = errno;
      err = std::strerror(last_errno);
      return false;
    }
    bytes += n;
    got = n;
    return true;
  }

  ~Impl() { if (f) std::fclose(f); }
};

FileByteSource::FileByteSource(std::string path)
  : FileByteSource(std::move(path), Config{}) {}

FileByteSource::FileByteSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

FileByteSource::~FileByteSource() { delete p_; }

bool FileByteSource::open() { return p_->open(); }
bool FileByteSource::is_open() const noexcept { return p_->f != nullptr; }
bool FileByteSource::read(char* dst, std::size_t cap, std::size_t& got) {
  return p_->read(dst, cap, got);
}
const std::string& FileByteSource::error() const { return p_->err; }
int  FileByteSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileByteSource::bytes_read() const noexcept { return p_->bytes; }
std::size_t FileByteSource::chunk_bytes() const noexcept { return p_->cfg.chunk_bytes; }

bool MemoryByteSource::read(char* dst, std::size_t cap, std::size_t& got) {
  got = std::min(cap, bytes_.size() - pos_);
  if (got) std::memcpy(dst, bytes_.data() + pos_, got);
  pos_ += got;
  return true;
}

bool read_all(ByteSource& src, InputBuffer& out, std::string* err_out,
              std::size_t chunk_bytes) {
  out.bytes.clear();
  out.truncated = false;
  out.io_error.clear();

  std::vector<char> buf(chunk_bytes > 0 ? chunk_bytes : 1);
  bool first = true;
  while (true) {
    std::size_t n = 0;
    if (!src.read(buf.data(), buf.size(), n)) {
      if (first) {
        if (err_out) *err_out = src.error();
        return false;
      }
      // Keep what arrived; the tokenizer reports Io where the bytes stop.
      out.truncated = true;
      out.io_error = src.error();
      return true;
    }
    first = false;
    if (n == 0) break;
    out.bytes.append(buf.data(), n);
  }
  return true;
}

}
