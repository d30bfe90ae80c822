#include "csvlint/line_ending_audit.hpp"

namespace csvlint {

std::size_t audit_line_endings(std::string_view bytes,
                               std::vector<ValidationError>& out) {
  const std::size_t before = out.size();
  const char* s = bytes.data();
  const std::size_t n = bytes.size();
  std::size_t line = 1;

  for (std::size_t i = 0; i < n; ++i) {
    if (s[i] == '\n') {
      if (i == 0 || s[i - 1] != '\r')
        out.push_back(ValidationError{std::nullopt, line, kind::InvalidLineEnding{}});
      ++line;
    } else if (s[i] == '\r') {
      if (i + 1 >= n || s[i + 1] != '\n')
        out.push_back(ValidationError{std::nullopt, line, kind::InvalidLineEnding{}});
    }
  }
  return out.size() - before;
}

}
