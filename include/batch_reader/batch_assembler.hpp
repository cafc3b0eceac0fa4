#pragma once
#include "batch_reader/row.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace br {

class CsvTokenizer;
class RecordView;

enum class LoadStrategy { WholeFile, Streaming };

// Files strictly under `threshold` bytes load whole; unknown (0) or larger
// sizes stream through a bounded buffer.
LoadStrategy select_strategy(std::uint64_t file_size, std::uint64_t threshold);

const char* to_string(LoadStrategy s) noexcept;

// Initial capacity for the outer batch list.
//   Streaming: max(1, size / (batch_size * bytes_per_row)) + 1
//   WholeFile: (size / bytes_per_row) / batch_size + 1
std::size_t batch_capacity_hint(LoadStrategy s, std::uint64_t file_size,
                                std::size_t batch_size, double bytes_per_row);

// Groups rows into batches of exactly `batch_size`; finish() flushes the
// remainder if non-empty.
class BatchAssembler {
public:
  BatchAssembler(const HeaderSet& headers, std::size_t batch_size,
                 std::size_t capacity_hint = 1);

  void push(const RecordView& rec);
  std::vector<Batch> finish();

  std::uint64_t rows() const noexcept { return rows_; }

private:
  const HeaderSet& headers_;
  std::size_t batch_size_;
  std::vector<Batch> batches_;
  Batch current_;
  std::uint64_t rows_{0};
};

// Header set for an operation: the tokenizer's header row when
// `has_headers`, else positional. Throws FormatError on a malformed header.
HeaderSet take_header(CsvTokenizer& tok, bool has_headers);

// Drain `tok` into batches. Throws FormatError on the first malformed record.
std::vector<Batch> assemble(CsvTokenizer& tok, const HeaderSet& headers,
                            std::size_t batch_size, std::size_t capacity_hint);

}
