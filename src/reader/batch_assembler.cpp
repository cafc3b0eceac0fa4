#include "batch_reader/batch_assembler.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/record_view.hpp"

#include <algorithm>

namespace br {

// Upper bounds on up-front reservations; past these the vectors grow normally.
static constexpr std::size_t kMaxBatchReserve = 64 * 1024;
static constexpr std::size_t kMaxBatchListReserve = 1024 * 1024;

LoadStrategy select_strategy(std::uint64_t file_size, std::uint64_t threshold) {
  if (file_size > 0 && file_size < threshold) return LoadStrategy::WholeFile;
  return LoadStrategy::Streaming;
}

const char* to_string(LoadStrategy s) noexcept {
  return s == LoadStrategy::WholeFile ? "whole_file" : "streaming";
}

std::size_t batch_capacity_hint(LoadStrategy s, std::uint64_t file_size,
                                std::size_t batch_size, double bytes_per_row) {
  if (batch_size == 0) batch_size = 1;
  if (!(bytes_per_row >= 1.0)) bytes_per_row = 1.0;
  const auto per_row = static_cast<std::uint64_t>(bytes_per_row);

  if (s == LoadStrategy::WholeFile) {
    const std::uint64_t est_rows = file_size / per_row;
    return static_cast<std::size_t>(est_rows / batch_size + 1);
  }
  const std::uint64_t est_batches = file_size / (static_cast<std::uint64_t>(batch_size) * per_row);
  return static_cast<std::size_t>(std::max<std::uint64_t>(1, est_batches) + 1);
}

BatchAssembler::BatchAssembler(const HeaderSet& headers, std::size_t batch_size,
                               std::size_t capacity_hint)
  : headers_(headers), batch_size_(batch_size == 0 ? 1 : batch_size) {
  batches_.reserve(std::min(capacity_hint, kMaxBatchListReserve));
  current_.reserve(std::min(batch_size_, kMaxBatchReserve));
}

void BatchAssembler::push(const RecordView& rec) {
  current_.push_back(make_row(headers_, rec));
  ++rows_;
  if (current_.size() >= batch_size_) {
    batches_.push_back(std::move(current_));
    current_ = Batch{};
    current_.reserve(std::min(batch_size_, kMaxBatchReserve));
  }
}

std::vector<Batch> BatchAssembler::finish() {
  if (!current_.empty()) {
    batches_.push_back(std::move(current_));
    current_ = Batch{};
  }
  return std::move(batches_);
}

HeaderSet take_header(CsvTokenizer& tok, bool has_headers) {
  if (!has_headers) return HeaderSet{};
  if (!tok.read_header()) throw FormatError("Failed to read CSV headers: " + tok.error());
  return HeaderSet(tok.header());
}

std::vector<Batch> assemble(CsvTokenizer& tok, const HeaderSet& headers,
                            std::size_t batch_size, std::size_t capacity_hint) {
  BatchAssembler batcher(headers, batch_size, capacity_hint);
  RecordView rec;
  while (true) {
    switch (tok.next(rec)) {
      case CsvTokenizer::Status::Record:
        batcher.push(rec);
        break;
      case CsvTokenizer::Status::End:
        return batcher.finish();
      case CsvTokenizer::Status::Error:
        throw FormatError("Failed to read CSV record: " + tok.error());
    }
  }
}

}
