#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace br {

// Block-wise producer of raw bytes. Tokenizers pull blocks until an empty
// view signals end of input.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Next block of bytes; empty at end of input. The view stays valid until
  // the following call. Throws IoError on read failure.
  virtual std::string_view next_block() = 0;

  // Absolute file offset of the first byte the next next_block() returns.
  virtual std::uint64_t position() const noexcept = 0;
};

// A flat buffer already in memory (whole-file strategy).
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string_view data, std::uint64_t base_offset = 0)
      : data_(data), base_(base_offset) {}

  std::string_view next_block() override;
  std::uint64_t position() const noexcept override { return base_ + (done_ ? data_.size() : 0); }

private:
  std::string_view data_;
  std::uint64_t base_{0};
  bool done_{false};
};

// Buffered, seekable read handle over a file. Closed on destruction.
class FileSource : public ByteSource {
public:
  struct Config {
    std::size_t buffer_bytes = 64 * 1024; // 64 KiB
  };

  explicit FileSource(std::string path);      // uses default Config{}
  FileSource(std::string path, Config cfg);   // throws IoError if open fails
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::string_view next_block() override;
  std::uint64_t position() const noexcept override;

  // Reposition; the next block starts at `offset`. Throws IoError.
  void seek(std::uint64_t offset);

  std::uint64_t bytes_read() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Read an entire file into memory. Throws IoError.
std::string read_whole_file(const std::string& path, std::uint64_t size_hint = 0);

}
