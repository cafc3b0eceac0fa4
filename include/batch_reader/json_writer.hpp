#pragma once
#include "batch_reader/row.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace br {

struct FileInfo;
struct OpStats;

// Compact JSON renderings for the CLI and HTTP front end.
// Rows become objects with keys in field order.
class JsonWriter {
public:
  static std::string to_json(const Row& row);
  static std::string to_json(const std::vector<Row>& rows);
  static std::string to_json(const std::vector<Batch>& batches);
  static std::string to_json(const FileInfo& info);
  static std::string to_json(const OpStats& stats);

  static std::string count_json(std::uint64_t rows);
  static std::string error_json(const std::string& message);
};

}
