#include "batch_reader/row.hpp"
#include "batch_reader/record_view.hpp"

#include <stdexcept>
#include <unordered_set>

namespace br {

HeaderSet::HeaderSet(std::vector<std::string> names)
  : names_(std::move(names)), positional_(false) {
  std::unordered_set<std::string_view> seen;
  seen.reserve(names_.size());
  for (const auto& n : names_) {
    if (!seen.insert(n).second) { duplicates_ = true; break; }
  }
}

void Row::set(std::string key, std::string value) {
  for (auto& f : fields_) {
    if (f.first == key) { f.second = std::move(value); return; }
  }
  fields_.emplace_back(std::move(key), std::move(value));
}

const std::string* Row::find(std::string_view key) const noexcept {
  for (const auto& f : fields_) if (f.first == key) return &f.second;
  return nullptr;
}

const std::string& Row::at(std::string_view key) const {
  if (const std::string* v = find(key)) return *v;
  throw std::out_of_range("row has no field named '" + std::string(key) + "'");
}

Row make_row(const HeaderSet& headers, const RecordView& rec) {
  Row row;
  if (headers.positional()) {
    row.reserve(rec.size());
    for (std::size_t i = 0; i < rec.size(); ++i)
      row.append(std::to_string(i), std::string(rec.at(i)));
    return row;
  }

  const auto& names = headers.names();
  const std::size_t n = rec.size() < names.size() ? rec.size() : names.size();
  row.reserve(n);
  if (headers.has_duplicates()) {
    for (std::size_t i = 0; i < n; ++i) row.set(names[i], std::string(rec.at(i)));
  } else {
    for (std::size_t i = 0; i < n; ++i) row.append(names[i], std::string(rec.at(i)));
  }
  return row;
}

}
