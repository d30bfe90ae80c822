#include "csvlint/errors.hpp"

namespace csvlint {

namespace {

struct Describe {
  std::string operator()(kind::FieldCount) const { return "wrong number of fields"; }
  std::string operator()(kind::BareQuote) const { return "bare \" in non-quoted-field"; }
  std::string operator()(kind::Quote) const { return "quote in quoted field"; }
  std::string operator()(kind::InvalidEscape) const { return "invalid escape sequence"; }
  std::string operator()(kind::UnterminatedQuote) const { return "unterminated quote"; }
  std::string operator()(kind::InvalidLineEnding) const {
    return "invalid line ending (RFC 4180 requires CRLF)";
  }
  std::string operator()(kind::UnescapedSpecialChars) const {
    return "field contains unescaped special characters";
  }
  std::string operator()(kind::TrailingComma) const { return "trailing comma found"; }
  std::string operator()(const kind::Io& e) const { return "I/O error: " + e.message; }
  std::string operator()(const kind::Utf8& e) const { return "UTF-8 error: " + e.message; }
};

struct Name {
  std::string_view operator()(kind::FieldCount) const { return "FieldCount"; }
  std::string_view operator()(kind::BareQuote) const { return "BareQuote"; }
  std::string_view operator()(kind::Quote) const { return "Quote"; }
  std::string_view operator()(kind::InvalidEscape) const { return "InvalidEscape"; }
  std::string_view operator()(kind::UnterminatedQuote) const { return "UnterminatedQuote"; }
  std::string_view operator()(kind::InvalidLineEnding) const { return "InvalidLineEnding"; }
  std::string_view operator()(kind::UnescapedSpecialChars) const { return "UnescapedSpecialChars"; }
  std::string_view operator()(kind::TrailingComma) const { return "TrailingComma"; }
  std::string_view operator()(const kind::Io&) const { return "Io"; }
  std::string_view operator()(const kind::Utf8&) const { return "Utf8"; }
};

}

std::string describe(const ErrorKind& k) { return std::visit(Describe{}, k); }

std::string_view kind_name(const ErrorKind& k) { return std::visit(Name{}, k); }

bool is_fatal(const ErrorKind& k) {
  return holds<kind::Io>(k) || holds<kind::Utf8>(k);
}

bool is_quote_error(const ErrorKind& k) {
  return holds<kind::BareQuote>(k) || holds<kind::Quote>(k) ||
         holds<kind::UnterminatedQuote>(k);
}

bool operator==(const ValidationError& a, const ValidationError& b) {
  return a.record_num == b.record_num && a.kind == b.kind && a.record == b.record;
}

std::string to_string(const ValidationError& e) {
  return "Record #" + std::to_string(e.record_num) + " has error: " + describe(e.kind);
}

}
