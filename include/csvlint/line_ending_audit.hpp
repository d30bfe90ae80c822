#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

#include "csvlint/errors.hpp"

namespace csvlint {

// Flags every terminator that is not exactly CRLF: a '\n' without a '\r'
// before it, or a '\r' without a '\n' after it. Each error carries the
// physical line number (1-based, bumped on every '\n'), not a record number.
// Returns the number of errors appended.
std::size_t audit_line_endings(std::string_view bytes,
                               std::vector<ValidationError>& out);

}
