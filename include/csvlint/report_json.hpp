#pragma once
#include <cstdint>
#include <string>

#include "csvlint/metrics.hpp"
#include "csvlint/validator.hpp"

namespace csvlint {

struct ReportPayload {
  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;

  // Effective configuration
  char delimiter = ',';
  bool lazy_quotes = false;
  bool strict = false;

  // Outcome
  ValidationResult result;
  int exit_status = 0;

  RunStats stats;
};

class ReportJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const ReportPayload& p);
};

}
