#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "csvlint/errors.hpp"

namespace csvlint {

class ByteSource;
class MetricsRegistry;
struct InputBuffer;

struct ValidationConfig {
  char delimiter   = ',';
  bool lazy_quotes = false; // tolerate malformed quoting, skip field counts
  bool strict      = false; // RFC 4180 mode: audit line endings
};

struct ValidationResult {
  std::vector<ValidationError> errors; // detection order
  bool halted = false;

  bool ok() const noexcept { return errors.empty(); }
};

// Buffers `src` once, then audits line endings (strict only), tokenizes and
// checks field counts. Returns false only when the first read from `src`
// fails; every other problem is reported inside `out`.
bool validate(ByteSource& src, const ValidationConfig& cfg, ValidationResult& out,
              std::string* err_out = nullptr, MetricsRegistry* metrics = nullptr);

ValidationResult validate(std::string_view bytes, const ValidationConfig& cfg,
                          MetricsRegistry* metrics = nullptr);

ValidationResult validate_buffer(const InputBuffer& input, const ValidationConfig& cfg,
                                 MetricsRegistry* metrics = nullptr);

}
