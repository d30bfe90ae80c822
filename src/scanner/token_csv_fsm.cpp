#include "csvlint/token_csv_fsm.hpp"
#include "csvlint/record_view.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <vector>

namespace csvlint {

struct CsvFsm::Impl {
  CsvConfig cfg;
  std::string_view in;
  std::size_t pos{0};
  std::size_t line{1};

  bool stream_failed{false};
  std::string stream_error;

  // Decoded fields of the current record, back-to-back.
  std::string buf;
  std::vector<std::size_t> ends;
  ErrorKind err{kind::FieldCount{}};

  Impl(const CsvConfig& c, std::string_view input) : cfg(c), in(input) {}

  bool at_end() const { return pos >= in.size(); }
  static bool is_eol(char c) { return c == '\r' || c == '\n'; }

  // Consume one byte; CRLF counts as a single line break.
  void step() {
    const char c = in[pos++];
    if (c == '\n' || (c == '\r' && (at_end() || in[pos] != '\n'))) ++line;
  }

  void eat_terminator() {
    if (in[pos] == '\r') {
      step();
      if (!at_end() && in[pos] == '\n') step();
    } else {
      step();
    }
  }

  // Resync: drop the rest of the physical line, terminator included.
  void skip_line() {
    while (!at_end() && !is_eol(in[pos])) step();
    if (!at_end()) eat_terminator();
  }

  // A malformed quote written as \" is reported as an escape problem.
  ErrorKind classify_quote(std::size_t quote_pos, ErrorKind fallback) const {
    if (quote_pos > 0 && in[quote_pos - 1] == '\\') return kind::InvalidEscape{};
    return fallback;
  }

  Status fail(ErrorKind k) {
    err = std::move(k);
    if (!is_fatal(err)) skip_line();
    return Status::Error;
  }

  static bool all_ascii(const std::string& s) {
    for (unsigned char c : s) if (c >= 0x80) return false;
    return true;
  }

  // Each field is checked on its own: a truncated sequence at the end of one
  // field and a stray continuation byte opening the next read as valid once
  // concatenated.
  Status finish(std::size_t rec_line, std::size_t rec_offset) {
    if (all_ascii(buf)) return Status::Record;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < ends.size(); ++i) {
      if (!simdjson::validate_utf8(buf.data() + begin, ends[i] - begin)) {
        return fail(kind::Utf8{"invalid UTF-8 in field " + std::to_string(i + 1) +
                               " (line " + std::to_string(rec_line) +
                               ", byte " + std::to_string(rec_offset) + ")"});
      }
      begin = ends[i];
    }
    return Status::Record;
  }

  Status read_record() {
    buf.clear();
    ends.clear();

    // Empty lines carry no record.
    while (!at_end() && is_eol(in[pos])) eat_terminator();
    if (at_end()) {
      if (stream_failed) return fail(kind::Io{stream_error});
      return Status::End;
    }

    const std::size_t rec_line = line;
    const std::size_t rec_offset = pos;
    enum class Mode { StartField, Unquoted, Quoted, QuoteInQuoted } mode = Mode::StartField;

    while (true) {
      if (at_end()) {
        // Bytes past this point were never delivered; nothing here is trustworthy.
        if (stream_failed) return fail(kind::Io{stream_error});
        if (mode == Mode::Quoted && !cfg.lazy_quotes) return fail(kind::UnterminatedQuote{});
        ends.push_back(buf.size());
        return finish(rec_line, rec_offset);
      }

      const char c = in[pos];
      switch (mode) {
        case Mode::StartField:
          if (c == cfg.quote && c != cfg.delimiter) {
            mode = Mode::Quoted;
            step();
          } else {
            mode = Mode::Unquoted; // re-read c as the first unquoted byte
          }
          break;

        case Mode::Unquoted:
          if (c == cfg.delimiter) {
            ends.push_back(buf.size());
            step();
            mode = Mode::StartField;
          } else if (is_eol(c)) {
            ends.push_back(buf.size());
            eat_terminator();
            return finish(rec_line, rec_offset);
          } else if (c == cfg.quote && !cfg.lazy_quotes) {
            return fail(classify_quote(pos, kind::BareQuote{}));
          } else {
            buf.push_back(c);
            step();
          }
          break;

        case Mode::Quoted:
          if (c == cfg.quote) {
            mode = Mode::QuoteInQuoted;
          } else {
            buf.push_back(c);
          }
          step();
          break;

        case Mode::QuoteInQuoted:
          if (c == cfg.quote) {
            buf.push_back(c); // "" escape
            step();
            mode = Mode::Quoted;
          } else if (c == cfg.delimiter) {
            ends.push_back(buf.size());
            step();
            mode = Mode::StartField;
          } else if (is_eol(c)) {
            ends.push_back(buf.size());
            eat_terminator();
            return finish(rec_line, rec_offset);
          } else if (!cfg.lazy_quotes) {
            return fail(classify_quote(pos - 1, kind::Quote{}));
          } else {
            buf.push_back(cfg.quote); // keep the stray quote, stay quoted
            mode = Mode::Quoted;
          }
          break;
      }
    }
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg, std::string_view input)
  : p_(new Impl(cfg, input)) {}

CsvFsm::~CsvFsm() { delete p_; }

void CsvFsm::set_stream_error(std::string message) {
  p_->stream_failed = true;
  p_->stream_error = std::move(message);
}

CsvFsm::Status CsvFsm::next(RecordView& out) {
  Status st = p_->read_record();
  if (st == Status::Record) {
    out = RecordView(&p_->buf, &p_->ends);
    ++records_;
  }
  return st;
}

const ErrorKind& CsvFsm::error() const { return p_->err; }
std::size_t CsvFsm::line() const noexcept { return p_->line; }

}
