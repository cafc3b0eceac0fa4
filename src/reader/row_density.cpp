#include "batch_reader/row_density.hpp"
#include "batch_reader/byte_source.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/metrics.hpp"
#include "batch_reader/reader_config.hpp"
#include "batch_reader/record_view.hpp"

#include <spdlog/spdlog.h>

namespace br {

RowDensity estimate_row_density(const std::string& path, bool has_headers,
                                const ReaderConfig& cfg) {
  FileSource src(path, FileSource::Config{cfg.stream_buffer_bytes});
  CsvConfig ccfg;
  ccfg.delimiter = cfg.delimiter;
  ccfg.quote = cfg.quote;
  ccfg.header = has_headers;
  CsvTokenizer tok(src, ccfg);

  if (has_headers && !tok.read_header()) {
    throw FormatError("Failed to read headers: " + tok.error());
  }

  RowDensity d;
  d.data_offset = tok.offset();

  RecordView rec;
  while (d.samples < cfg.density_sample_rows) {
    const std::uint64_t at = tok.offset();
    const std::uint64_t line = tok.line();
    const auto st = tok.next(rec);
    if (st == CsvTokenizer::Status::End) break;
    if (st == CsvTokenizer::Status::Error) {
      throw FormatError("Error reading sample row: " + tok.error());
    }
    // Blank lines before a record count toward its length and its line span.
    const std::uint64_t len = tok.offset() - at;
    if (d.samples == 0 || len < d.min_row_bytes) d.min_row_bytes = len;
    if (len > d.max_row_bytes) d.max_row_bytes = len;
    if (tok.line() - line > 1) d.multi_line = true;
    ++d.samples;
  }

  if (d.samples > 0) {
    d.bytes_per_row = static_cast<double>(tok.offset() - d.data_offset) /
                      static_cast<double>(d.samples);
  } else {
    d.bytes_per_row = cfg.default_bytes_per_row;
  }

  if (cfg.metrics) cfg.metrics->add_bytes(src.bytes_read());
  spdlog::debug("row density: {:.2f} bytes/row ({}..{}) over {} samples, data at {}",
                d.bytes_per_row, d.min_row_bytes, d.max_row_bytes, d.samples, d.data_offset);
  return d;
}

}
