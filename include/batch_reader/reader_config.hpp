#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace br {

class MetricsRegistry;

// What count_rows() does with a malformed record.
enum class CountPolicy { SkipMalformed, Abort };

// Tunables for BatchReader. The size heuristics are allocation and seek
// hints only; none of them changes which rows an operation returns.
struct ReaderConfig {
  char delimiter = ',';
  char quote     = '"';

  std::size_t   stream_buffer_bytes  = 64 * 1024;          // 64 KiB
  std::uint64_t whole_file_threshold = 100ull * 1024 * 1024; // 100 MiB

  // Assumed bytes per row when pre-sizing the batch list.
  double stream_bytes_per_row_hint     = 100.0;
  double whole_file_bytes_per_row_hint = 50.0;

  std::size_t   density_sample_rows   = 100;
  double        default_bytes_per_row = 100.0;
  std::uint64_t seek_min_start_row    = 1000; // seek only when start_row is past this

  CountPolicy count_policy = CountPolicy::SkipMalformed;

  MetricsRegistry* metrics = nullptr; // optional, not owned
};

// Load overrides from a JSON object whose keys match the fields above
// ("count_policy": "skip" | "abort"). Unknown keys are ignored.
bool load_config_file(const std::string& path, ReaderConfig& cfg,
                      std::string* err_out = nullptr);

}
