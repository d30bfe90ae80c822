#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "csvlint/errors.hpp"

namespace csvlint {

class RecordView;

// Compares every record against the header's field count.
class FieldCountChecker {
public:
  // A disabled checker (lazy quotes) never reports.
  explicit FieldCountChecker(bool enabled = true) : enabled_(enabled) {}

  void set_header(const RecordView& header);

  // Appends a FieldCount error carrying the record's fields on mismatch.
  // Returns true when an error was appended.
  bool check(const RecordView& rec, std::size_t record_num,
             std::vector<ValidationError>& out) const;

private:
  bool enabled_;
  std::optional<std::size_t> expected_;
};

}
