#pragma once
#include <string_view>
#include <vector>
#include <cstddef>

namespace br {

// Lightweight view over one tokenized record. Fields point into the
// tokenizer's scratch buffer and stay valid until the next record is read.
class RecordView {
public:
  RecordView() = default;
  explicit RecordView(const std::vector<std::string_view>* fields) : fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }

  // Get field by index.
  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  const std::vector<std::string_view>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string_view>* fields_{nullptr};
};

}
