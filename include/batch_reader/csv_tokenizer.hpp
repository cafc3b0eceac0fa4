#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace br {

class ByteSource;
class RecordView;

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool header    = true;
};

// Pull-style CSV record tokenizer over a ByteSource.
//
// Quotes open a quoted field only at the start of a field; a doubled quote
// inside is a literal quote and quoted fields may span lines. Records end at
// \n, \r\n or a lone \r outside quotes; blank lines are skipped. On a
// malformed record next() returns Error, error() names the cause and the rest
// of the physical line is discarded so the caller may keep reading.
class CsvTokenizer {
public:
  enum class Status { Record, End, Error };

  CsvTokenizer(ByteSource& src, const CsvConfig& cfg);
  ~CsvTokenizer();

  CsvTokenizer(const CsvTokenizer&) = delete;
  CsvTokenizer& operator=(const CsvTokenizer&) = delete;

  // Consume the header row if configured and not yet read. Returns false on
  // a malformed header (see error()). An empty input yields an empty header.
  bool read_header();
  const std::vector<std::string>& header() const;

  // Next data record. `out` is valid until the following call.
  // Reads the header first when configured. Throws IoError from the source.
  Status next(RecordView& out);

  // Discard bytes through the next '\n'. False if input ended first.
  bool skip_line();

  // Absolute byte offset just past the last consumed byte.
  std::uint64_t offset() const noexcept;

  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t line() const noexcept;
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
  std::string err_;
};

}
