#include "csvlint/consistency_check.hpp"
#include "csvlint/record_view.hpp"

namespace csvlint {

void FieldCountChecker::set_header(const RecordView& header) {
  expected_ = header.size();
}

bool FieldCountChecker::check(const RecordView& rec, std::size_t record_num,
                              std::vector<ValidationError>& out) const {
  if (!enabled_ || !expected_) return false;
  if (rec.size() == *expected_) return false;
  out.push_back(ValidationError{rec.to_strings(), record_num, kind::FieldCount{}});
  return true;
}

}
