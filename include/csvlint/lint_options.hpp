#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace csvlint {

struct ValidationConfig;

// Command-line view of a run, before it is resolved into a ValidationConfig.
struct LintOptions {
  std::string delimiter = ",";
  bool lazy_quotes = false;
  bool rfc4180 = false;
};

// Accepts ",", "\t" (backslash + t), "|", ":", ";" or any single byte.
bool parse_delimiter(std::string_view s, char& out, std::string* err_out = nullptr);

// RFC 4180 mode forces ',' and strict quoting; conflicting flags are
// reported through `warnings`, not as failures. Returns false on a bad
// delimiter outside RFC 4180 mode.
bool resolve_config(const LintOptions& opt, ValidationConfig& cfg,
                    std::vector<std::string>& warnings,
                    std::string* err_out = nullptr);

}
