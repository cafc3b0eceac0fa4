#pragma once
#include "batch_reader/batch_assembler.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/reader_config.hpp"
#include "batch_reader/row.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace br {

struct FileInfo {
  std::string path;
  std::uint64_t size_bytes = 0;
  double size_mb = 0.0;
  std::size_t batch_size = 0;
  bool has_headers = true;
  std::vector<std::string> headers; // empty without headers or on read failure
};

// Read-only accessor over one delimited file.
//
// The {path, batch size, header flag, byte length} tuple is captured at
// construction and never changes; the byte length is a snapshot and goes
// stale if the file changes afterwards. Every operation opens its own
// handles, so one reader may serve concurrent callers.
class BatchReader {
public:
  using Config = ReaderConfig;

  // Throws std::invalid_argument for batch_size == 0 and IoError when the
  // file cannot be opened. Unreadable metadata leaves file_size() at 0.
  BatchReader(std::string path, std::size_t batch_size, bool has_headers = true);
  BatchReader(std::string path, std::size_t batch_size, bool has_headers, Config cfg);

  // Every row of the file in batches of batch_size(); the last may be short.
  // All-or-nothing: a malformed record throws FormatError.
  std::vector<Batch> read_all() const;

  // Data rows, header excluded. Malformed records follow config().count_policy.
  std::uint64_t count_rows() const;

  // Up to num_rows rows starting at 0-based start_row; empty past the end.
  std::vector<Row> read_chunk(std::uint64_t start_row, std::size_t num_rows) const;

  FileInfo file_info() const;

  const std::string& path() const noexcept { return path_; }
  std::size_t batch_size() const noexcept { return batch_size_; }
  bool has_headers() const noexcept { return has_headers_; }
  std::uint64_t file_size() const noexcept { return file_size_; }
  const Config& config() const noexcept { return cfg_; }
  LoadStrategy strategy() const noexcept;

  CsvConfig csv_config(bool header) const noexcept;

  // Header set for a fresh operation, read through its own handle.
  // Positional when has_headers() is false. Throws IoError/FormatError.
  HeaderSet read_header_set() const;

private:
  std::vector<Batch> read_whole_file() const;
  std::vector<Batch> read_streaming() const;

  std::string path_;
  std::size_t batch_size_;
  bool has_headers_;
  std::uint64_t file_size_{0};
  Config cfg_;
};

}
