#include "batch_reader/byte_source.hpp"
#include "batch_reader/csv_tokenizer.hpp"
#include "batch_reader/record_view.hpp"

#include "test_util.hpp"

#include <string>
#include <vector>

using br::CsvTokenizer;
using Fields = std::vector<std::string>;

static Fields fields_of(const br::RecordView& r) {
  Fields out;
  for (std::size_t i = 0; i < r.size(); ++i) out.emplace_back(r.at(i));
  return out;
}

// Every record up to End; stops (and records the message) on the first Error.
static std::vector<Fields> drain(CsvTokenizer& tok, std::string* err = nullptr) {
  std::vector<Fields> out;
  br::RecordView rec;
  while (true) {
    auto st = tok.next(rec);
    if (st == CsvTokenizer::Status::End) break;
    if (st == CsvTokenizer::Status::Error) { if (err) *err = tok.error(); break; }
    out.push_back(fields_of(rec));
  }
  return out;
}

static br::CsvConfig no_header() {
  br::CsvConfig c;
  c.header = false;
  return c;
}

static void basic_with_offsets() {
  br::MemorySource src("a,b,c\n1,2,3\n4,5,6");
  CsvTokenizer tok(src, br::CsvConfig{});
  BR_EXPECT(tok.read_header());
  BR_EXPECT((tok.header() == Fields{"a", "b", "c"}));
  BR_EXPECT(tok.offset() == 6);

  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"1", "2", "3"}));
  BR_EXPECT(tok.offset() == 12);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"4", "5", "6"}));
  BR_EXPECT(tok.offset() == 17);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
  BR_EXPECT(tok.records() == 2);
}

static void header_read_implicitly() {
  br::MemorySource src("h1,h2\nx,y\n");
  CsvTokenizer tok(src, br::CsvConfig{});
  auto recs = drain(tok);
  BR_EXPECT(recs.size() == 1);
  BR_EXPECT((tok.header() == Fields{"h1", "h2"}));
}

static void quoting_rules() {
  br::MemorySource src("id,name\r\n1,\"x, y\"\r\n2,\"say \"\"hi\"\"\"\r\n3,\"multi\nline\"\r\n");
  CsvTokenizer tok(src, br::CsvConfig{});
  std::string err;
  auto recs = drain(tok, &err);
  BR_EXPECT(err.empty());
  BR_EXPECT(recs.size() == 3);
  if (recs.size() == 3) {
    BR_EXPECT((recs[0] == Fields{"1", "x, y"}));
    BR_EXPECT((recs[1] == Fields{"2", "say \"hi\""}));
    BR_EXPECT((recs[2] == Fields{"3", "multi\nline"}));
  }
  BR_EXPECT((tok.header() == Fields{"id", "name"}));
}

static void blank_and_empty_fields() {
  br::MemorySource src("a\n\n\r\nb\n,,\n");
  CsvTokenizer tok(src, no_header());
  auto recs = drain(tok);
  BR_EXPECT(recs.size() == 3);
  if (recs.size() == 3) {
    BR_EXPECT((recs[0] == Fields{"a"}));
    BR_EXPECT((recs[1] == Fields{"b"}));
    BR_EXPECT((recs[2] == Fields{"", "", ""}));
  }
}

static void lone_cr_terminates() {
  br::MemorySource src("a,b\rc,d\r");
  CsvTokenizer tok(src, no_header());
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT(tok.offset() == 4);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"c", "d"}));
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
}

static void last_record_without_newline() {
  br::MemorySource src("1,2\n3,4");
  CsvTokenizer tok(src, no_header());
  auto recs = drain(tok);
  BR_EXPECT(recs.size() == 2);
  if (recs.size() == 2) BR_EXPECT((recs[1] == Fields{"3", "4"}));
}

static void malformed_record_resyncs() {
  br::MemorySource src("1,2\n\"x\"y,3\n4,5\n");
  CsvTokenizer tok(src, no_header());
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Error);
  BR_EXPECT(tok.error().find("quoted field mismatch") != std::string::npos);
  BR_EXPECT(tok.error().find("line 2") != std::string::npos);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"4", "5"}));
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
}

static void unterminated_quote() {
  br::MemorySource src("1,\"open\nstill open");
  CsvTokenizer tok(src, no_header());
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Error);
  BR_EXPECT(tok.error().find("unterminated") != std::string::npos);
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
}

static void malformed_header() {
  br::MemorySource src("\"a\"b,c\n1,2\n");
  CsvTokenizer tok(src, br::CsvConfig{});
  BR_EXPECT(!tok.read_header());
  BR_EXPECT(!tok.error().empty());
}

static void empty_input() {
  br::MemorySource src("");
  CsvTokenizer tok(src, br::CsvConfig{});
  BR_EXPECT(tok.read_header());
  BR_EXPECT(tok.header().empty());
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
}

static void custom_dialect() {
  br::CsvConfig cfg = no_header();
  cfg.delimiter = ';';
  cfg.quote = '\'';
  br::MemorySource src("a;'b;c';'it''s'\n");
  CsvTokenizer tok(src, cfg);
  auto recs = drain(tok);
  BR_EXPECT(recs.size() == 1);
  if (!recs.empty()) BR_EXPECT((recs[0] == Fields{"a", "b;c", "it's"}));
}

// Tiny file buffers force every construct across block boundaries.
static void block_boundaries() {
  const fs::path f = write_temp("tok_blocks.csv", "abc\r\nd\r\n\"q,\"\"x\"\"\",z\n");
  for (std::size_t buf : {1u, 2u, 3u, 4u, 7u}) {
    br::FileSource src(f.string(), br::FileSource::Config{buf});
    CsvTokenizer tok(src, no_header());
    br::RecordView rec;
    BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
    BR_EXPECT((fields_of(rec) == Fields{"abc"}));
    BR_EXPECT(tok.offset() == 5);
    BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
    BR_EXPECT(tok.offset() == 8);
    BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
    BR_EXPECT((fields_of(rec) == Fields{"q,\"x\"", "z"}));
    BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::End);
  }
}

static void skip_line_tracks_offset() {
  const fs::path f = write_temp("tok_skip.csv", "hello\nworld\n");
  br::FileSource src(f.string(), br::FileSource::Config{3});
  CsvTokenizer tok(src, no_header());
  BR_EXPECT(tok.skip_line());
  BR_EXPECT(tok.offset() == 6);
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"world"}));
  BR_EXPECT(tok.offset() == 12);
  BR_EXPECT(!tok.skip_line());
}

// A seeked source reports absolute offsets.
static void offsets_after_seek() {
  const fs::path f = write_temp("tok_seek.csv", "aaaa\nbbbb\ncccc\n");
  br::FileSource src(f.string(), br::FileSource::Config{4});
  src.seek(7);
  CsvTokenizer tok(src, no_header());
  BR_EXPECT(tok.skip_line());
  BR_EXPECT(tok.offset() == 10);
  br::RecordView rec;
  BR_EXPECT(tok.next(rec) == CsvTokenizer::Status::Record);
  BR_EXPECT((fields_of(rec) == Fields{"cccc"}));
}

int main() {
  basic_with_offsets();
  header_read_implicitly();
  quoting_rules();
  blank_and_empty_fields();
  lone_cr_terminates();
  last_record_without_newline();
  malformed_record_resyncs();
  unterminated_quote();
  malformed_header();
  empty_input();
  custom_dialect();
  block_boundaries();
  skip_line_tracks_offset();
  offsets_after_seek();
  return report("csv_tokenizer");
}
