#include "batch_reader/batch_reader.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/http_server.hpp"
#include "batch_reader/json_writer.hpp"
#include "batch_reader/metrics.hpp"
#include "batch_reader/reader_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

enum class Op { Info, Count, Chunk, Read };

struct Cli {
  std::string file;
  std::size_t batch_size = 1000;
  bool has_headers = true;
  std::string config_path;
  Op op = Op::Info;
  std::uint64_t chunk_start = 0;
  std::size_t chunk_rows = 0;
  bool stats = false;
  bool serve = false;
  int port = 8080;
  bool verbose = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: batch-reader <file> [--batch-size=N] [--no-header] [--config=FILE]\n"
    "                    [--info | --count | --chunk=START:N | --read] [--stats]\n"
    "                    [--serve [--port=N]] [--verbose]\n";
}

// Returns false (after printing why) on a usage error.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    try {
      if (eat("--batch-size=", &v)) { c.batch_size = std::stoull(v); continue; }
      if (eat("--port=", &v))       { c.port = std::stoi(v); continue; }
      if (eat("--config=", &c.config_path)) continue;
      if (eat("--chunk=", &v)) {
        auto colon = v.find(':');
        if (colon == std::string::npos) {
          std::cerr << "[batch-reader] --chunk expects START:N\n";
          return false;
        }
        c.chunk_start = std::stoull(v.substr(0, colon));
        c.chunk_rows  = std::stoull(v.substr(colon + 1));
        c.op = Op::Chunk;
        continue;
      }
    } catch (const std::logic_error&) {
      std::cerr << "[batch-reader] bad number in " << a << "\n";
      return false;
    }
    if (a == "--no-header") { c.has_headers = false; continue; }
    if (a == "--info")      { c.op = Op::Info;  continue; }
    if (a == "--count")     { c.op = Op::Count; continue; }
    if (a == "--read")      { c.op = Op::Read;  continue; }
    if (a == "--stats")     { c.stats = true;   continue; }
    if (a == "--serve")     { c.serve = true;   continue; }
    if (a == "--verbose")   { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (!a.empty() && a[0] != '-' && c.file.empty()) { c.file = a; continue; }
    std::cerr << "[batch-reader] unknown argument: " << a << "\n";
    return false;
  }
  if (c.file.empty()) { usage(std::cerr); return false; }
  return true;
}

int serve(const br::BatchReader& reader, int port) {
  br::HttpServer::Config cfg;
  cfg.port = port;
  br::HttpServer server(reader, cfg);
  if (!server.start()) {
    std::cerr << "[serve] failed to bind port " << port << "\n";
    return 2;
  }
  std::cerr << "[serve] " << reader.path() << " on http://127.0.0.1:" << server.port() << "\n";
  return server.serve() ? 0 : 2;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) return 1;
  if (cli.verbose) spdlog::set_level(spdlog::level::debug);

  br::ReaderConfig cfg;
  if (!cli.config_path.empty()) {
    std::string err;
    if (!br::load_config_file(cli.config_path, cfg, &err)) {
      std::cerr << "[batch-reader] config: " << err << "\n";
      return 1;
    }
  }
  br::MetricsRegistry metrics;
  if (cli.stats) cfg.metrics = &metrics;

  try {
    br::BatchReader reader(cli.file, cli.batch_size, cli.has_headers, cfg);
    if (cli.serve) return serve(reader, cli.port);

    switch (cli.op) {
      case Op::Info:
        std::cout << br::JsonWriter::to_json(reader.file_info()) << "\n";
        break;
      case Op::Count:
        std::cout << br::JsonWriter::count_json(reader.count_rows()) << "\n";
        break;
      case Op::Chunk:
        std::cout << br::JsonWriter::to_json(reader.read_chunk(cli.chunk_start, cli.chunk_rows)) << "\n";
        break;
      case Op::Read:
        std::cout << br::JsonWriter::to_json(reader.read_all()) << "\n";
        break;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "[batch-reader] " << e.what() << "\n";
    return 1;
  } catch (const br::IoError& e) {
    std::cerr << "[batch-reader] I/O error: " << e.what() << "\n";
    return 2;
  } catch (const br::FormatError& e) {
    std::cerr << "[batch-reader] format error: " << e.what() << "\n";
    return 3;
  }

  if (cli.stats) std::cerr << br::JsonWriter::to_json(metrics.snapshot()) << "\n";
  return 0;
}
