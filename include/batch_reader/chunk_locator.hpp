#pragma once
#include "batch_reader/row.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace br {

class BatchReader;

// Finds and reads a window of rows.
//
//   near the start:  linear skip-and-read
//   far into file:   sample row widths -> seek with a two-row undershoot ->
//                    re-align to a row boundary -> skip to the target -> read
//   otherwise:       linear skip fallback
//
// The seek path is taken only for fixed-width single-line rows, and is
// abandoned for the linear one when the landing point is off the row grid
// or a skipped row has another width.
class ChunkLocator {
public:
  explicit ChunkLocator(const BatchReader& reader) : reader_(reader) {}

  std::vector<Row> read(std::uint64_t start_row, std::size_t num_rows) const;

  // Linear reference path; always exact.
  std::vector<Row> read_linear(std::uint64_t start_row, std::size_t num_rows) const;

private:
  // False when the estimate cannot be used; `out` is untouched then.
  bool try_seek(std::uint64_t start_row, std::size_t num_rows,
                std::vector<Row>& out) const;

  const BatchReader& reader_;
};

}
