#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace br {

struct ReaderConfig;

struct RowDensity {
  double bytes_per_row = 0.0;
  std::uint64_t data_offset = 0; // first byte after the header row
  std::size_t samples = 0;       // 0 means bytes_per_row is the configured default

  // Byte length range of the sampled records, terminators included.
  std::uint64_t min_row_bytes = 0;
  std::uint64_t max_row_bytes = 0;
  bool multi_line = false;       // a sampled record spanned more than one line

  // Every sampled record had the same length and sat on a single line.
  bool fixed_width() const noexcept {
    return samples > 0 && !multi_line && min_row_bytes == max_row_bytes;
  }
};

// Sample up to cfg.density_sample_rows records from the start of `path`
// through a fresh handle. Header skip failures and malformed samples throw
// FormatError; I/O failures throw IoError.
RowDensity estimate_row_density(const std::string& path, bool has_headers,
                                const ReaderConfig& cfg);

}
