#include "batch_reader/batch_reader.hpp"
#include "batch_reader/errors.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

static char delimiter_for(const fs::path& p) {
  return p.filename().string().find("semicolon") != std::string::npos ? ';' : ',';
}

struct Res {
  bool ok{true};
  std::uint64_t rows{0};
  std::uint64_t batches{0};
  std::string err;
};

// read_all must agree with count_rows and with one chunk spanning the file.
static Res run_csv(const fs::path& f) {
  Res r;
  br::ReaderConfig cfg;
  cfg.delimiter = delimiter_for(f);
  try {
    br::BatchReader reader(f.string(), 2, true, cfg);
    auto all = reader.read_all();
    std::vector<br::Row> flat;
    for (const auto& b : all) flat.insert(flat.end(), b.begin(), b.end());
    r.batches = all.size();
    r.rows = flat.size();

    const std::uint64_t counted = reader.count_rows();
    if (counted != r.rows) {
      r.ok = false;
      r.err = "count_rows=" + std::to_string(counted) + " but read_all returned " + std::to_string(r.rows);
    } else if (reader.read_chunk(0, flat.size() + 1) != flat) {
      r.ok = false;
      r.err = "read_chunk(0, all) differs from read_all";
    }
  } catch (const br::FormatError& e) {
    r.ok = false;
    r.err = e.what();
  } catch (const br::IoError& e) {
    r.ok = false;
    r.err = e.what();
  }
  return r;
}

int main(int argc, char** argv) {
  const fs::path dir = argc > 1 ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) { std::cerr << "[ERR] missing: " << dir << "\n"; return 2; }

  int total = 0, passed = 0, failed = 0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (!ieq_ext(p.extension().string(), ".csv")) continue;

    const Res r = run_csv(p);
    const bool expect_ok = expected_ok_for(p);
    const bool verdict = (r.ok == expect_ok);

    ++total; verdict ? ++passed : ++failed;

    if (verdict) {
      std::cout << "[PASS] " << p.filename().string()
                << "  rows=" << r.rows
                << "  batches=" << r.batches
                << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
    } else {
      std::cout << "[FAIL] " << p.filename().string()
                << "  rows=" << r.rows
                << "  expected_ok=" << (expect_ok?"true":"false")
                << "  actual_ok=" << (r.ok?"true":"false") << "\n";
      if (!r.err.empty())
        std::cout << "       error: " << r.err << "\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}
