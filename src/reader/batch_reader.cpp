#include "batch_reader/batch_reader.hpp"
#include "batch_reader/byte_source.hpp"
#include "batch_reader/chunk_locator.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/metrics.hpp"
#include "batch_reader/record_view.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace br {

static std::uint64_t total_rows(const std::vector<Batch>& batches) {
  std::uint64_t n = 0;
  for (const auto& b : batches) n += b.size();
  return n;
}

BatchReader::BatchReader(std::string path, std::size_t batch_size, bool has_headers)
  : BatchReader(std::move(path), batch_size, has_headers, Config{}) {}

BatchReader::BatchReader(std::string path, std::size_t batch_size, bool has_headers, Config cfg)
  : path_(std::move(path)), batch_size_(batch_size), has_headers_(has_headers), cfg_(cfg) {
  if (batch_size_ == 0) throw std::invalid_argument("batch_size must be positive");

  std::FILE* f = std::fopen(path_.c_str(), "rb");
  if (!f) throw IoError(describe_errno("Failed to open file", errno));
  std::fclose(f);

  std::error_code ec;
  const auto sz = std::filesystem::file_size(path_, ec);
  if (ec) {
    spdlog::warn("batch_reader: cannot stat {} ({}); treating size as 0", path_, ec.message());
    file_size_ = 0;
  } else {
    file_size_ = static_cast<std::uint64_t>(sz);
  }
}

LoadStrategy BatchReader::strategy() const noexcept {
  return select_strategy(file_size_, cfg_.whole_file_threshold);
}

CsvConfig BatchReader::csv_config(bool header) const noexcept {
  CsvConfig c;
  c.delimiter = cfg_.delimiter;
  c.quote = cfg_.quote;
  c.header = header;
  return c;
}

HeaderSet BatchReader::read_header_set() const {
  if (!has_headers_) return HeaderSet{};
  FileSource src(path_, FileSource::Config{cfg_.stream_buffer_bytes});
  CsvTokenizer tok(src, csv_config(true));
  return take_header(tok, true);
}

std::vector<Batch> BatchReader::read_all() const {
  ScopedStage stage(cfg_.metrics, "read_all");
  const LoadStrategy s = strategy();
  spdlog::debug("read_all: {} ({} bytes, batch_size={})", to_string(s), file_size_, batch_size_);

  std::vector<Batch> batches = (s == LoadStrategy::WholeFile) ? read_whole_file()
                                                              : read_streaming();
  if (cfg_.metrics) {
    cfg_.metrics->increment(s == LoadStrategy::WholeFile ? "read_all.whole_file"
                                                         : "read_all.streaming");
    cfg_.metrics->add_rows(total_rows(batches));
  }
  return batches;
}

std::vector<Batch> BatchReader::read_whole_file() const {
  const std::string content = br::read_whole_file(path_, file_size_);
  if (cfg_.metrics) cfg_.metrics->add_bytes(content.size());

  MemorySource src(content);
  CsvTokenizer tok(src, csv_config(has_headers_));
  const HeaderSet headers = take_header(tok, has_headers_);

  const std::size_t hint = batch_capacity_hint(LoadStrategy::WholeFile, content.size(),
                                               batch_size_, cfg_.whole_file_bytes_per_row_hint);
  return assemble(tok, headers, batch_size_, hint);
}

std::vector<Batch> BatchReader::read_streaming() const {
  FileSource src(path_, FileSource::Config{cfg_.stream_buffer_bytes});
  CsvTokenizer tok(src, csv_config(has_headers_));
  const HeaderSet headers = take_header(tok, has_headers_);

  const std::size_t hint = batch_capacity_hint(LoadStrategy::Streaming, file_size_,
                                               batch_size_, cfg_.stream_bytes_per_row_hint);
  std::vector<Batch> batches = assemble(tok, headers, batch_size_, hint);
  if (cfg_.metrics) cfg_.metrics->add_bytes(src.bytes_read());
  return batches;
}

std::uint64_t BatchReader::count_rows() const {
  ScopedStage stage(cfg_.metrics, "count_rows");
  FileSource src(path_, FileSource::Config{cfg_.stream_buffer_bytes});
  CsvTokenizer tok(src, csv_config(has_headers_));

  if (has_headers_ && !tok.read_header()) {
    throw FormatError("Failed to read headers: " + tok.error());
  }

  std::uint64_t rows = 0, skipped = 0;
  RecordView rec;
  bool done = false;
  while (!done) {
    switch (tok.next(rec)) {
      case CsvTokenizer::Status::Record:
        ++rows;
        break;
      case CsvTokenizer::Status::End:
        done = true;
        break;
      case CsvTokenizer::Status::Error:
        if (cfg_.count_policy == CountPolicy::Abort) {
          throw FormatError("Failed to read CSV record: " + tok.error());
        }
        ++skipped;
        spdlog::debug("count_rows: skipping malformed record: {}", tok.error());
        break;
    }
  }

  if (cfg_.metrics) {
    cfg_.metrics->add_bytes(src.bytes_read());
    if (skipped) cfg_.metrics->increment("count.skipped", skipped);
  }
  return rows;
}

std::vector<Row> BatchReader::read_chunk(std::uint64_t start_row, std::size_t num_rows) const {
  ScopedStage stage(cfg_.metrics, "read_chunk");
  std::vector<Row> rows = ChunkLocator(*this).read(start_row, num_rows);
  if (cfg_.metrics) cfg_.metrics->add_rows(rows.size());
  return rows;
}

FileInfo BatchReader::file_info() const {
  std::error_code ec;
  const auto sz = std::filesystem::file_size(path_, ec);
  if (ec) throw IoError("Failed to get file metadata: " + ec.message());

  FileInfo info;
  info.path = path_;
  info.size_bytes = static_cast<std::uint64_t>(sz);
  info.size_mb = static_cast<double>(info.size_bytes) / (1024.0 * 1024.0);
  info.batch_size = batch_size_;
  info.has_headers = has_headers_;

  if (has_headers_) {
    try {
      FileSource src(path_, FileSource::Config{cfg_.stream_buffer_bytes});
      CsvTokenizer tok(src, csv_config(true));
      if (tok.read_header()) info.headers = tok.header();
      else spdlog::debug("file_info: header row unreadable: {}", tok.error());
    } catch (const IoError& e) {
      spdlog::debug("file_info: header row unreadable: {}", e.what());
    }
  }
  return info;
}

}
