#include "csvlint/line_ending_audit.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::vector<std::size_t> lines_of(std::string_view in) {
  std::vector<csvlint::ValidationError> errs;
  const std::size_t n = csvlint::audit_line_endings(in, errs);
  std::vector<std::size_t> out;
  for (const auto& e : errs) {
    if (!csvlint::holds<csvlint::kind::InvalidLineEnding>(e.kind)) ++failures;
    if (e.record) ++failures;
    out.push_back(e.record_num);
  }
  if (n != errs.size()) ++failures;
  return out;
}

int main() {
  expect(lines_of("").empty(), "empty buffer");
  expect(lines_of("a,b\r\nc,d\r\n").empty(), "all CRLF");
  expect(lines_of("a,b").empty(), "no terminator at all");

  // every LF-only terminator is flagged at its own line
  expect(lines_of("a\nb\nc\n") == std::vector<std::size_t>{1, 2, 3}, "LF only");

  // LF at buffer start
  expect(lines_of("\na\r\n") == std::vector<std::size_t>{1}, "leading LF");

  // lone CR does not advance the line counter
  expect(lines_of("a\rb\rc\r\n") == std::vector<std::size_t>{1, 1}, "lone CRs");

  // CR at buffer end
  expect(lines_of("a\r\nb\r") == std::vector<std::size_t>{2}, "trailing CR");

  // LF CR order is two errors
  expect(lines_of("a\n\rb") == std::vector<std::size_t>{1, 2}, "LF then CR");

  // CRLF inside a quoted field is fine; bare LF inside one is still flagged
  expect(lines_of("\"x\r\ny\",z\r\n").empty(), "quoted CRLF");
  expect(lines_of("\"x\ny\",z\r\n") == std::vector<std::size_t>{1}, "quoted LF");

  // appends after existing entries
  {
    std::vector<csvlint::ValidationError> errs(2);
    expect(csvlint::audit_line_endings("a\n", errs) == 1 && errs.size() == 3, "appends");
  }

  if (failures) return 1;
  std::cout << "[PASS] line ending audit\n";
  return 0;
}
