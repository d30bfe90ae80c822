#include "csvlint/summary.hpp"
#include "csvlint/validator.hpp"

namespace csvlint {

ExitStatus exit_status(const ValidationResult& r) {
  if (r.ok()) return ExitStatus::Valid;
  return r.halted ? ExitStatus::Failed : ExitStatus::Errors;
}

ErrorTally tally(const ValidationResult& r) {
  ErrorTally t;
  for (const auto& e : r.errors) {
    if (holds<kind::FieldCount>(e.kind)) ++t.field_count;
    else if (holds<kind::InvalidLineEnding>(e.kind)) ++t.line_ending;
    else if (is_quote_error(e.kind)) ++t.quote;
    else ++t.other;
  }
  return t;
}

void print_summary(std::ostream& os, const ValidationResult& r, bool rfc4180) {
  if (r.ok()) {
    os << (rfc4180 ? "file is valid and complies with RFC 4180" : "file is valid") << "\n";
    return;
  }

  const ErrorTally t = tally(r);
  os << "Found " << r.errors.size() << " validation error(s):\n";
  if (t.field_count) os << "  - " << t.field_count << " field count error(s)\n";
  if (t.line_ending) os << "  - " << t.line_ending << " line ending error(s) (RFC 4180 requires CRLF)\n";
  if (t.quote)       os << "  - " << t.quote << " quote/escaping error(s)\n";
  if (t.other)       os << "  - " << t.other << " other error(s)\n";
  os << "\n";

  for (const auto& e : r.errors) os << to_string(e) << "\n";

  if (r.halted) os << "\nunable to parse any further\n";
}

}
