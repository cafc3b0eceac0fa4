#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/byte_source.hpp"
#include "batch_reader/record_view.hpp"

#include <string_view>
#include <vector>

namespace br {

struct CsvTokenizer::Impl {
  ByteSource& src;
  CsvConfig cfg;

  std::string_view block;
  std::size_t pos{0};
  std::uint64_t block_start{0};
  std::uint64_t line{1};
  bool eof{false};

  // Field bytes of the current record live in `scratch`; `ends` marks the
  // end of each field so views can be cut once the record is complete.
  std::string scratch;
  std::vector<std::size_t> ends;
  std::vector<std::string_view> fields;

  std::vector<std::string> header;
  bool header_done{false};

  Impl(ByteSource& s, const CsvConfig& c) : src(s), cfg(c), block_start(s.position()) {}

  bool refill() {
    if (eof) return false;
    block_start = src.position();
    block = src.next_block();
    pos = 0;
    if (block.empty()) { eof = true; return false; }
    return true;
  }

  // -1 at end of input
  int get() {
    if (pos == block.size() && !refill()) return -1;
    return static_cast<unsigned char>(block[pos++]);
  }

  // After a '\r' terminator swallow a directly following '\n'.
  void eat_lf() {
    if (pos == block.size() && !refill()) return;
    if (block[pos] == '\n') ++pos;
  }

  bool skip_line() {
    while (true) {
      if (pos == block.size() && !refill()) return false;
      const char* b = block.data() + pos;
      const void* nl = std::char_traits<char>::find(b, block.size() - pos, '\n');
      if (nl) {
        pos += static_cast<const char*>(nl) - b + 1;
        ++line;
        return true;
      }
      pos = block.size();
    }
  }

  void end_field() { ends.push_back(scratch.size()); }

  void cut_fields() {
    fields.clear();
    fields.reserve(ends.size());
    std::size_t start = 0;
    for (std::size_t e : ends) {
      fields.emplace_back(scratch.data() + start, e - start);
      start = e;
    }
  }

  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape };

  Status parse_record(std::string& err) {
    scratch.clear();
    ends.clear();
    Mode mode = Mode::FieldStart;
    bool any = false;
    const std::uint64_t start_line = line;

    while (true) {
      const int c = get();
      if (c < 0) {
        if (mode == Mode::Quoted) {
          err = "CSV parse error (unterminated quoted field) at line " + std::to_string(start_line);
          return Status::Error;
        }
        if (!any) return Status::End;
        end_field();
        cut_fields();
        return Status::Record;
      }
      const char ch = static_cast<char>(c);
      const bool is_nl = (ch == '\n' || ch == '\r');

      switch (mode) {
        case Mode::FieldStart:
          if (ch == cfg.quote) {
            mode = Mode::Quoted;
            any = true;
          } else if (ch == cfg.delimiter) {
            end_field();
            any = true;
          } else if (is_nl) {
            if (ch == '\r') eat_lf();
            ++line;
            if (!any) continue; // blank line
            end_field();
            cut_fields();
            return Status::Record;
          } else {
            scratch.push_back(ch);
            mode = Mode::Unquoted;
            any = true;
          }
          break;
        case Mode::Unquoted:
          if (ch == cfg.delimiter) {
            end_field();
            mode = Mode::FieldStart;
          } else if (is_nl) {
            if (ch == '\r') eat_lf();
            ++line;
            end_field();
            cut_fields();
            return Status::Record;
          } else {
            scratch.push_back(ch);
          }
          break;
        case Mode::Quoted:
          if (ch == cfg.quote) {
            mode = Mode::QuoteEscape;
          } else {
            if (ch == '\n') ++line;
            scratch.push_back(ch);
          }
          break;
        case Mode::QuoteEscape:
          if (ch == cfg.quote) {
            scratch.push_back(ch);          // escaped quote
            mode = Mode::Quoted;
          } else if (ch == cfg.delimiter) {
            end_field();
            mode = Mode::FieldStart;
          } else if (is_nl) {
            if (ch == '\r') eat_lf();
            ++line;
            end_field();
            cut_fields();
            return Status::Record;
          } else {
            err = "CSV parse error (quoted field mismatch) at line " + std::to_string(line);
            skip_line();
            return Status::Error;
          }
          break;
      }
    }
  }
};

CsvTokenizer::CsvTokenizer(ByteSource& src, const CsvConfig& cfg)
  : p_(new Impl(src, cfg)) {}

CsvTokenizer::~CsvTokenizer() { delete p_; }

const std::vector<std::string>& CsvTokenizer::header() const { return p_->header; }

bool CsvTokenizer::read_header() {
  if (!p_->cfg.header || p_->header_done) return true;
  p_->header_done = true;
  switch (p_->parse_record(err_)) {
    case Status::Error:
      return false;
    case Status::End:
      return true;
    case Status::Record:
      p_->header.assign(p_->fields.begin(), p_->fields.end());
      return true;
  }
  return true;
}

CsvTokenizer::Status CsvTokenizer::next(RecordView& out) {
  if (p_->cfg.header && !p_->header_done && !read_header()) return Status::Error;
  Status st = p_->parse_record(err_);
  if (st == Status::Record) {
    out = RecordView(&p_->fields);
    ++records_;
  }
  return st;
}

bool CsvTokenizer::skip_line() { return p_->skip_line(); }

std::uint64_t CsvTokenizer::offset() const noexcept { return p_->block_start + p_->pos; }
std::uint64_t CsvTokenizer::line() const noexcept { return p_->line; }

}
