#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace csvlint {

// Pull-style byte reader the validator drains once.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to `cap` bytes into `dst`; `got == 0` with a true return means
  // end of stream. Returns false on a read failure (see error()).
  virtual bool read(char* dst, std::size_t cap, std::size_t& got) = 0;

  virtual const std::string& error() const = 0;
};

class FileByteSource : public ByteSource {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB per fread
  };

  explicit FileByteSource(std::string path);      // uses default Config{}
  FileByteSource(std::string path, Config cfg);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  // Opens the file; false on failure with last_error() holding errno.
  bool open();
  bool is_open() const noexcept;

  bool read(char* dst, std::size_t cap, std::size_t& got) override;
  const std::string& error() const override;

  int last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::size_t chunk_bytes() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Serves an in-memory buffer; the bytes must outlive the source.
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string_view bytes) : bytes_(bytes) {}

  bool read(char* dst, std::size_t cap, std::size_t& got) override;
  const std::string& error() const override { return err_; }

private:
  std::string_view bytes_;
  std::size_t pos_{0};
  std::string err_;
};

// Whole-input buffer. When the source failed after delivering some bytes,
// `truncated` is set and `io_error` carries the source's message.
struct InputBuffer {
  std::string bytes;
  bool truncated = false;
  std::string io_error;
};

// Drains `src` into `out`. Returns false only when the very first read fails.
bool read_all(ByteSource& src, InputBuffer& out, std::string* err_out = nullptr,
              std::size_t chunk_bytes = 64 * 1024);

}
