#include "csvlint/lint_options.hpp"
#include "csvlint/validator.hpp"

namespace csvlint {

bool parse_delimiter(std::string_view s, char& out, std::string* err_out) {
  if (s == "\\t") { out = '\t'; return true; }
  if (s.size() == 1) { out = s[0]; return true; }
  if (err_out) {
    *err_out = "error parsing delimiter '" + std::string(s) +
               "', note that only one-character delimiters are supported";
  }
  return false;
}

bool resolve_config(const LintOptions& opt, ValidationConfig& cfg,
                    std::vector<std::string>& warnings,
                    std::string* err_out) {
  if (opt.rfc4180) {
    if (opt.delimiter != ",")
      warnings.emplace_back("Warning: --rfc4180 mode requires comma delimiter, ignoring --delimiter option");
    if (opt.lazy_quotes)
      warnings.emplace_back("Warning: --rfc4180 mode disables lazy quotes, ignoring --lazyquotes option");
    cfg.delimiter = ',';
    cfg.lazy_quotes = false;
    cfg.strict = true;
    return true;
  }

  char d = ',';
  if (!parse_delimiter(opt.delimiter, d, err_out)) return false;
  cfg.delimiter = d;
  cfg.lazy_quotes = opt.lazy_quotes;
  cfg.strict = false;

  if (opt.delimiter != "," || opt.lazy_quotes)
    warnings.emplace_back("Warning: not using defaults, may not validate CSV to RFC 4180");
  return true;
}

}
