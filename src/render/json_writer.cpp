#include "batch_reader/json_writer.hpp"
#include "batch_reader/batch_reader.hpp"
#include "batch_reader/metrics.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace br {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void write_row(std::ostringstream& o, const Row& row) {
  o << "{";
  bool first = true;
  for (const auto& f : row) {
    if (!first) o << ",";
    first = false;
    esc(o, f.first); o << ":"; esc(o, f.second);
  }
  o << "}";
}

static void write_rows(std::ostringstream& o, const std::vector<Row>& rows) {
  o << "[";
  for (size_t i=0;i<rows.size();++i){
    if (i) o << ",";
    write_row(o, rows[i]);
  }
  o << "]";
}

std::string JsonWriter::to_json(const Row& row) {
  std::ostringstream o;
  write_row(o, row);
  return o.str();
}

std::string JsonWriter::to_json(const std::vector<Row>& rows) {
  std::ostringstream o;
  write_rows(o, rows);
  return o.str();
}

std::string JsonWriter::to_json(const std::vector<Batch>& batches) {
  std::ostringstream o;
  o << "[";
  for (size_t i=0;i<batches.size();++i){
    if (i) o << ",";
    write_rows(o, batches[i]);
  }
  o << "]";
  return o.str();
}

std::string JsonWriter::to_json(const FileInfo& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":";   esc(o, p.path); o << ",";
  o << "\"size_bytes\":"  << p.size_bytes << ",";
  o << "\"size_mb\":"     << safe_num(p.size_mb) << ",";
  o << "\"batch_size\":"  << p.batch_size << ",";
  o << "\"has_headers\":" << (p.has_headers ? "true" : "false") << ",";
  o << "\"headers\":[";
  for (size_t i=0;i<p.headers.size();++i){
    if (i) o << ",";
    esc(o, p.headers[i]);
  }
  o << "]";
  o << "}";
  return o.str();
}

std::string JsonWriter::to_json(const OpStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << s.rows << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"calls\":" << s.stages[i].calls;
    o << ",\"duration_ms\":" << safe_num(s.stages[i].total_ms) << "}";
  }
  o << "],";

  o << "\"counters\":{";
  bool first=true;
  for (auto& kv : s.counters) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";

  o << "}";
  return o.str();
}

std::string JsonWriter::count_json(std::uint64_t rows) {
  std::ostringstream o;
  o << "{\"rows\":" << rows << "}";
  return o.str();
}

std::string JsonWriter::error_json(const std::string& message) {
  std::ostringstream o;
  o << "{\"error\":"; esc(o, message); o << "}";
  return o.str();
}

}
