#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "csvlint/errors.hpp"

namespace csvlint {

class RecordView;

struct CsvConfig {
  char delimiter   = ',';
  char quote       = '"';
  bool lazy_quotes = false; // keep malformed quotes literally instead of failing
};

// Pull tokenizer over a fully buffered input. Records end at CRLF, LF or a
// lone CR; empty lines are skipped.
class CsvFsm {
public:
  enum class Status { Record, End, Error };

  // `input` must outlive the tokenizer.
  CsvFsm(const CsvConfig& cfg, std::string_view input);
  ~CsvFsm();

  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // The bytes after `input` could not be read. Running out of input then
  // fails with kind::Io instead of ending cleanly.
  void set_stream_error(std::string message);

  // On Record, `out` views the decoded fields until the next call.
  // On Error, error() holds the kind; syntax errors leave the position just
  // past the next line terminator so reading can continue.
  Status next(RecordView& out);

  const ErrorKind& error() const;
  std::uint64_t records() const noexcept { return records_; }
  std::size_t line() const noexcept;     // 1-based physical line at the cursor

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
};

}
