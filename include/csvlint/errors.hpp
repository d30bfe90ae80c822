#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace csvlint {

// Error taxonomy. Closed set; Io and Utf8 carry the underlying message.
namespace kind {
struct FieldCount {};
struct BareQuote {};
struct Quote {};
struct InvalidEscape {};
struct UnterminatedQuote {};
struct InvalidLineEnding {};
struct UnescapedSpecialChars {}; // reserved, no detection rule
struct TrailingComma {};         // reserved, no detection rule
struct Io   { std::string message; };
struct Utf8 { std::string message; };

inline bool operator==(FieldCount, FieldCount) { return true; }
inline bool operator==(BareQuote, BareQuote) { return true; }
inline bool operator==(Quote, Quote) { return true; }
inline bool operator==(InvalidEscape, InvalidEscape) { return true; }
inline bool operator==(UnterminatedQuote, UnterminatedQuote) { return true; }
inline bool operator==(InvalidLineEnding, InvalidLineEnding) { return true; }
inline bool operator==(UnescapedSpecialChars, UnescapedSpecialChars) { return true; }
inline bool operator==(TrailingComma, TrailingComma) { return true; }
inline bool operator==(const Io& a, const Io& b) { return a.message == b.message; }
inline bool operator==(const Utf8& a, const Utf8& b) { return a.message == b.message; }
}

using ErrorKind = std::variant<kind::FieldCount,
                               kind::BareQuote,
                               kind::Quote,
                               kind::InvalidEscape,
                               kind::UnterminatedQuote,
                               kind::InvalidLineEnding,
                               kind::UnescapedSpecialChars,
                               kind::TrailingComma,
                               kind::Io,
                               kind::Utf8>;

// Human-readable description, e.g. "wrong number of fields".
std::string describe(const ErrorKind& k);

// Stable identifier for reports, e.g. "FieldCount".
std::string_view kind_name(const ErrorKind& k);

// Io and Utf8 halt the scan; everything else is per-record.
bool is_fatal(const ErrorKind& k);

// Counted as a quote/escaping problem in the summary.
bool is_quote_error(const ErrorKind& k);

template <class K>
bool holds(const ErrorKind& k) { return std::holds_alternative<K>(k); }

struct ValidationError {
  // Empty when the record could not be decoded at all.
  std::optional<std::vector<std::string>> record;
  // Data records count from 1 after the header; 0 means the header itself
  // could not be read. Line-ending errors carry a physical line number.
  std::size_t record_num = 0;
  ErrorKind kind;
};

bool operator==(const ValidationError& a, const ValidationError& b);

// "Record #3 has error: wrong number of fields"
std::string to_string(const ValidationError& e);

}
