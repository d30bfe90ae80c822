#include "csvlint/validator.hpp"
#include "csvlint/byte_source.hpp"
#include "csvlint/consistency_check.hpp"
#include "csvlint/line_ending_audit.hpp"
#include "csvlint/metrics.hpp"
#include "csvlint/record_view.hpp"
#include "csvlint/token_csv_fsm.hpp"

namespace csvlint {

namespace {

void push(ValidationResult& r, ValidationError e, MetricsRegistry* metrics) {
  if (metrics) metrics->add_error(kind_name(e.kind));
  r.errors.push_back(std::move(e));
}

ValidationResult run(std::string_view bytes, const std::string* io_error,
                     const ValidationConfig& cfg, MetricsRegistry* metrics) {
  ValidationResult r;

  if (cfg.strict) {
    if (metrics) metrics->start_stage("audit");
    const std::size_t first = r.errors.size();
    audit_line_endings(bytes, r.errors);
    if (metrics) {
      for (std::size_t i = first; i < r.errors.size(); ++i)
        metrics->add_error(kind_name(r.errors[i].kind));
      metrics->end_stage("audit");
    }
  }

  if (metrics) metrics->start_stage("tokenize");

  CsvConfig ccfg;
  ccfg.delimiter = cfg.delimiter;
  ccfg.lazy_quotes = cfg.lazy_quotes;
  CsvFsm csv(ccfg, bytes);
  if (io_error) csv.set_stream_error(*io_error);

  FieldCountChecker checker(!cfg.lazy_quotes);
  RecordView rv;

  // Header: establishes the expected field count, or ends the scan.
  switch (csv.next(rv)) {
    case CsvFsm::Status::End:
      if (metrics) metrics->end_stage("tokenize");
      return r;
    case CsvFsm::Status::Error:
      push(r, ValidationError{std::nullopt, 0, csv.error()}, metrics);
      r.halted = true;
      if (metrics) metrics->end_stage("tokenize");
      return r;
    case CsvFsm::Status::Record:
      if (metrics) metrics->add_record();
      checker.set_header(rv);
      break;
  }

  std::size_t record_num = 0;
  while (true) {
    const CsvFsm::Status st = csv.next(rv);
    if (st == CsvFsm::Status::End) break;
    ++record_num;

    if (st == CsvFsm::Status::Record) {
      if (metrics) metrics->add_record();
      if (checker.check(rv, record_num, r.errors) && metrics)
        metrics->add_error(kind_name(r.errors.back().kind));
      continue;
    }

    push(r, ValidationError{std::nullopt, record_num, csv.error()}, metrics);
    if (is_fatal(csv.error())) {
      r.halted = true;
      break;
    }
  }

  if (metrics) metrics->end_stage("tokenize");
  return r;
}

}

ValidationResult validate(std::string_view bytes, const ValidationConfig& cfg,
                          MetricsRegistry* metrics) {
  if (metrics) metrics->add_bytes(bytes.size());
  return run(bytes, nullptr, cfg, metrics);
}

ValidationResult validate_buffer(const InputBuffer& input, const ValidationConfig& cfg,
                                 MetricsRegistry* metrics) {
  if (metrics) metrics->add_bytes(input.bytes.size());
  return run(input.bytes, input.truncated ? &input.io_error : nullptr, cfg, metrics);
}

bool validate(ByteSource& src, const ValidationConfig& cfg, ValidationResult& out,
              std::string* err_out, MetricsRegistry* metrics) {
  InputBuffer input;
  if (metrics) metrics->start_stage("read");
  const bool ok = read_all(src, input, err_out);
  if (metrics) metrics->end_stage("read");
  if (!ok) return false;
  out = validate_buffer(input, cfg, metrics);
  return true;
}

}
