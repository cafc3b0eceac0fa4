#include "batch_reader/chunk_locator.hpp"
#include "batch_reader/batch_reader.hpp"
#include "batch_reader/byte_source.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/metrics.hpp"
#include "batch_reader/record_view.hpp"
#include "batch_reader/row_density.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace br {

namespace {

constexpr std::size_t kMaxChunkReserve = 64 * 1024;

// Discard up to `n` records; malformed ones count as discarded.
// False if the input ended first.
bool skip_records(CsvTokenizer& tok, std::uint64_t n) {
  RecordView rec;
  for (std::uint64_t i = 0; i < n; ++i) {
    if (tok.next(rec) == CsvTokenizer::Status::End) return false;
  }
  return true;
}

std::vector<Row> take_rows(CsvTokenizer& tok, const HeaderSet& headers, std::size_t n) {
  std::vector<Row> out;
  out.reserve(std::min(n, kMaxChunkReserve));
  RecordView rec;
  while (out.size() < n) {
    switch (tok.next(rec)) {
      case CsvTokenizer::Status::Record:
        out.push_back(make_row(headers, rec));
        break;
      case CsvTokenizer::Status::End:
        return out;
      case CsvTokenizer::Status::Error:
        throw FormatError("Failed to read CSV record: " + tok.error());
    }
  }
  return out;
}

void bump(MetricsRegistry* m, const char* counter) {
  if (m) m->increment(counter);
}

}

std::vector<Row> ChunkLocator::read(std::uint64_t start_row, std::size_t num_rows) const {
  const auto& cfg = reader_.config();

  if (start_row > cfg.seek_min_start_row && reader_.file_size() > 0) {
    std::vector<Row> out;
    if (try_seek(start_row, num_rows, out)) {
      bump(cfg.metrics, "chunk.seek");
      return out;
    }
    bump(cfg.metrics, "chunk.fallback");
    return read_linear(start_row, num_rows);
  }

  bump(cfg.metrics, "chunk.linear");
  return read_linear(start_row, num_rows);
}

std::vector<Row> ChunkLocator::read_linear(std::uint64_t start_row, std::size_t num_rows) const {
  const auto& cfg = reader_.config();
  FileSource src(reader_.path(), FileSource::Config{cfg.stream_buffer_bytes});
  CsvTokenizer tok(src, reader_.csv_config(reader_.has_headers()));
  const HeaderSet headers = take_header(tok, reader_.has_headers());

  std::vector<Row> rows;
  if (skip_records(tok, start_row)) rows = take_rows(tok, headers, num_rows);

  if (cfg.metrics) cfg.metrics->add_bytes(src.bytes_read());
  return rows;
}

bool ChunkLocator::try_seek(std::uint64_t start_row, std::size_t num_rows,
                            std::vector<Row>& out) const {
  const auto& cfg = reader_.config();

  RowDensity d;
  {
    ScopedStage stage(cfg.metrics, "estimate");
    d = estimate_row_density(reader_.path(), reader_.has_headers(), cfg);
  }
  // Row indices are derived from byte offsets, which only holds for
  // fixed-width single-line rows.
  if (!d.fixed_width()) {
    spdlog::debug("read_chunk: sampled rows are {}..{} bytes over {} rows{}, falling back to linear skip",
                  d.min_row_bytes, d.max_row_bytes, d.samples, d.multi_line ? " (multi-line)" : "");
    return false;
  }
  const std::uint64_t row_len = d.min_row_bytes;
  const std::uint64_t size = reader_.file_size();

  if (size <= d.data_offset || start_row > (size - d.data_offset) / row_len) {
    spdlog::debug("read_chunk: row {} is past EOF ({} bytes at {} bytes/row), falling back to linear skip",
                  start_row, size, row_len);
    return false;
  }
  const std::uint64_t estimated_pos = d.data_offset + row_len * start_row;
  if (estimated_pos >= size) {
    spdlog::debug("read_chunk: estimate {} is past EOF ({}), falling back to linear skip",
                  estimated_pos, size);
    return false;
  }

  // Undershoot by two rows so the target row is not skipped.
  const std::uint64_t safe_pos = estimated_pos - d.data_offset >= 2 * row_len
                                     ? estimated_pos - 2 * row_len
                                     : d.data_offset;

  FileSource data(reader_.path(), FileSource::Config{cfg.stream_buffer_bytes});
  const bool at_boundary = (safe_pos == d.data_offset);
  data.seek(at_boundary ? d.data_offset : safe_pos - 1);

  auto give_up = [&](const char* why) {
    if (cfg.metrics) cfg.metrics->add_bytes(data.bytes_read());
    spdlog::debug("read_chunk: {} after seeking to {}, falling back to linear skip", why, safe_pos);
    return false;
  };

  CsvTokenizer tok(data, reader_.csv_config(false));
  // Starting one byte early makes a seek that lands exactly on a row start
  // consume only the preceding '\n'.
  if (!at_boundary && !tok.skip_line()) return give_up("no row boundary");

  const std::uint64_t landing = tok.offset();
  if ((landing - d.data_offset) % row_len != 0) return give_up("landed off the row grid");
  const std::uint64_t landing_row = (landing - d.data_offset) / row_len;
  if (landing_row > start_row) return give_up("landed past the target row");

  spdlog::debug("read_chunk: {} bytes/row, seek {} -> row {} at {}, target row {}",
                row_len, safe_pos, landing_row, landing, start_row);

  // The seeked handle is past the header region; names come from a second handle.
  const HeaderSet headers = reader_.read_header_set();

  // Each skipped record must have the sampled width or the row count is unknown.
  RecordView rec;
  for (std::uint64_t row = landing_row; row < start_row; ++row) {
    const std::uint64_t at = tok.offset();
    const auto st = tok.next(rec);
    if (st == CsvTokenizer::Status::End) {
      out.clear();
      if (cfg.metrics) cfg.metrics->add_bytes(data.bytes_read());
      return true;
    }
    if (st == CsvTokenizer::Status::Error || tok.offset() - at != row_len) {
      return give_up("row width changed");
    }
  }

  out = take_rows(tok, headers, num_rows);
  if (cfg.metrics) cfg.metrics->add_bytes(data.bytes_read());
  return true;
}

}
