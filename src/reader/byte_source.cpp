#include "batch_reader/byte_source.hpp"
#include "batch_reader/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#ifdef _WIN32
  #define br_fseek64 _fseeki64
  using br_off_t = long long;
#else
  #define br_fseek64 fseeko
  using br_off_t = off_t;
#endif

namespace br {

std::string describe_errno(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

std::string_view MemorySource::next_block() {
  if (done_) return {};
  done_ = true;
  return data_;
}

struct FileSource::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  std::vector<char> buf;
  std::uint64_t pos{0};   // offset of the next block
  std::uint64_t bytes{0};

  ~Impl() { if (f) std::fclose(f); }
};

FileSource::FileSource(std::string path)
  : FileSource(std::move(path), Config{}) {}

FileSource::FileSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {
  if (p_->cfg.buffer_bytes == 0) p_->cfg.buffer_bytes = Config{}.buffer_bytes;
  p_->f = std::fopen(p_->path.c_str(), "rb");
  if (!p_->f) {
    const int err = errno;
    delete p_;
    throw IoError(describe_errno("Failed to open file", err));
  }
  p_->buf.resize(p_->cfg.buffer_bytes);
}

FileSource::~FileSource() { delete p_; }

std::string_view FileSource::next_block() {
  std::size_t n = std::fread(p_->buf.data(), 1, p_->buf.size(), p_->f);
  if (n == 0 && std::ferror(p_->f)) {
    throw IoError(describe_errno("Failed to read file", errno));
  }
  p_->pos += n;
  p_->bytes += n;
  return std::string_view(p_->buf.data(), n);
}

std::uint64_t FileSource::position() const noexcept { return p_->pos; }

void FileSource::seek(std::uint64_t offset) {
  if (br_fseek64(p_->f, static_cast<br_off_t>(offset), SEEK_SET) != 0) {
    throw IoError(describe_errno("Failed to seek in file", errno));
  }
  p_->pos = offset;
}

std::uint64_t FileSource::bytes_read() const noexcept { return p_->bytes; }
const std::string& FileSource::path() const noexcept { return p_->path; }

std::string read_whole_file(const std::string& path, std::uint64_t size_hint) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) throw IoError(describe_errno("Failed to open file", errno));

  std::string content;
  content.reserve(static_cast<std::size_t>(size_hint));
  char chunk[64 * 1024];
  while (true) {
    std::size_t n = std::fread(chunk, 1, sizeof(chunk), f);
    if (n > 0) content.append(chunk, n);
    if (n < sizeof(chunk)) {
      if (std::ferror(f)) {
        const int err = errno;
        std::fclose(f);
        throw IoError(describe_errno("Failed to read file", err));
      }
      break;
    }
  }
  std::fclose(f);
  return content;
}

}
