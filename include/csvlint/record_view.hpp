#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace csvlint {

// Lightweight view over one tokenized record. Decoded field bytes live
// back-to-back in `buf`; `ends[i]` is the end offset of field i. The view is
// valid until the tokenizer produces its next record.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::string* buf, const std::vector<std::size_t>* ends)
      : buf_(buf), ends_(ends) {}

  std::size_t size() const noexcept { return ends_ ? ends_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }

  std::string_view at(std::size_t i) const {
    if (!buf_ || !ends_ || i >= ends_->size()) return std::string_view{};
    const std::size_t b = (i == 0) ? 0 : (*ends_)[i - 1];
    return std::string_view(buf_->data() + b, (*ends_)[i] - b);
  }

  // Owned copy, used when a record is attached to an error.
  std::vector<std::string> to_strings() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) out.emplace_back(at(i));
    return out;
  }

private:
  const std::string* buf_{nullptr};
  const std::vector<std::size_t>* ends_{nullptr};
};

}
