#include "batch_reader/reader_config.hpp"

#include <simdjson.h>

#include <string>
#include <string_view>

namespace br {

static bool single_char(std::string_view s, char& out) {
  if (s.size() != 1) return false;
  out = s[0];
  return true;
}

bool load_config_file(const std::string& path, ReaderConfig& cfg, std::string* err_out) {
  ReaderConfig next = cfg;
  try {
    simdjson::padded_string json = simdjson::padded_string::load(path).value();
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc = parser.iterate(json).value();
    simdjson::ondemand::object obj = doc.get_object().value();

    for (auto field : obj) {
      const std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value().value();

      if (key == "delimiter" || key == "quote") {
        char c = 0;
        if (!single_char(v.get_string().value(), c)) {
          if (err_out) *err_out = path + ": '" + std::string(key) + "' must be a single character";
          return false;
        }
        (key == "delimiter" ? next.delimiter : next.quote) = c;
      } else if (key == "stream_buffer_bytes") {
        next.stream_buffer_bytes = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "whole_file_threshold") {
        next.whole_file_threshold = v.get_uint64().value();
      } else if (key == "stream_bytes_per_row_hint") {
        next.stream_bytes_per_row_hint = v.get_double().value();
      } else if (key == "whole_file_bytes_per_row_hint") {
        next.whole_file_bytes_per_row_hint = v.get_double().value();
      } else if (key == "density_sample_rows") {
        next.density_sample_rows = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "default_bytes_per_row") {
        next.default_bytes_per_row = v.get_double().value();
      } else if (key == "seek_min_start_row") {
        next.seek_min_start_row = v.get_uint64().value();
      } else if (key == "count_policy") {
        const std::string_view p = v.get_string().value();
        if (p == "skip")       next.count_policy = CountPolicy::SkipMalformed;
        else if (p == "abort") next.count_policy = CountPolicy::Abort;
        else {
          if (err_out) *err_out = path + ": count_policy must be \"skip\" or \"abort\"";
          return false;
        }
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = path + ": " + e.what();
    return false;
  }

  cfg = next;
  return true;
}

}
