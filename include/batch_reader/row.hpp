#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace br {

class RecordView;

// Ordered field names for an operation. A positional set (no header row)
// names field i by the decimal text of i and never caps the field count.
class HeaderSet {
public:
  HeaderSet() = default;                       // positional
  explicit HeaderSet(std::vector<std::string> names);

  bool positional() const noexcept { return positional_; }
  std::size_t size() const noexcept { return names_.size(); }
  bool has_duplicates() const noexcept { return duplicates_; }
  const std::vector<std::string>& names() const noexcept { return names_; }

private:
  std::vector<std::string> names_;
  bool positional_{true};
  bool duplicates_{false};
};

// Insertion-ordered field name -> text mapping. Owns its strings.
class Row {
public:
  using Field = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Field>::const_iterator;

  void reserve(std::size_t n) { fields_.reserve(n); }

  // Append without checking for an existing key.
  void append(std::string key, std::string value) {
    fields_.emplace_back(std::move(key), std::move(value));
  }

  // Overwrite in place if `key` exists, else append.
  void set(std::string key, std::string value);

  // nullptr when absent.
  const std::string* find(std::string_view key) const noexcept;

  // Throws std::out_of_range when absent.
  const std::string& at(std::string_view key) const;

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }
  const_iterator begin() const noexcept { return fields_.begin(); }
  const_iterator end() const noexcept { return fields_.end(); }

  bool operator==(const Row& o) const { return fields_ == o.fields_; }
  bool operator!=(const Row& o) const { return !(*this == o); }

private:
  std::vector<Field> fields_;
};

using Batch = std::vector<Row>;

// Pair record fields with header names. Fields past the header count are
// dropped; headers without a field get no entry.
Row make_row(const HeaderSet& headers, const RecordView& rec);

}
