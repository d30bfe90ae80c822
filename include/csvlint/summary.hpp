#pragma once
#include <cstddef>
#include <ostream>

namespace csvlint {

struct ValidationResult;

// Process exit codes of the command-line tool.
enum class ExitStatus : int {
  Valid  = 0, // no errors
  Failed = 1, // halted, unreadable input, or bad arguments
  Errors = 2, // errors found, scan completed
};

ExitStatus exit_status(const ValidationResult& r);

struct ErrorTally {
  std::size_t field_count = 0;
  std::size_t line_ending = 0;
  std::size_t quote = 0; // bare, stray and unterminated quotes
  std::size_t other = 0;
};

ErrorTally tally(const ValidationResult& r);

// Human-readable report: a verdict line, or counts per category followed by
// one "Record #n has error: ..." line per error.
void print_summary(std::ostream& os, const ValidationResult& r, bool rfc4180);

}
