#include "csvlint/report_json.hpp"
#include "csvlint/summary.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace csvlint {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void write_error(std::ostringstream& o, const ValidationError& e) {
  o << "{\"record_num\":" << e.record_num << ",";
  o << "\"kind\":"; esc(o, std::string(kind_name(e.kind))); o << ",";
  o << "\"message\":"; esc(o, describe(e.kind)); o << ",";
  o << "\"record\":";
  if (!e.record) {
    o << "null";
  } else {
    o << "[";
    for (size_t i = 0; i < e.record->size(); ++i) {
      if (i) o << ",";
      esc(o, (*e.record)[i]);
    }
    o << "]";
  }
  o << "}";
}

std::string ReportJsonWriter::to_json(const ReportPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"delimiter\":"; esc(o, std::string(1, p.delimiter)); o << ",";
  o << "\"lazy_quotes\":" << (p.lazy_quotes ? "true" : "false") << ",";
  o << "\"rfc4180\":" << (p.strict ? "true" : "false") << ",";
  o << "\"valid\":" << (p.result.ok() ? "true" : "false") << ",";
  o << "\"halted\":" << (p.result.halted ? "true" : "false") << ",";
  o << "\"exit_status\":" << p.exit_status << ",";

  const ErrorTally t = tally(p.result);
  o << "\"tally\":{"
    << "\"field_count\":" << t.field_count << ","
    << "\"line_ending\":" << t.line_ending << ","
    << "\"quote\":"       << t.quote       << ","
    << "\"other\":"       << t.other
    << "},";

  o << "\"errors\":[";
  for (size_t i = 0; i < p.result.errors.size(); ++i) {
    if (i) o << ",";
    write_error(o, p.result.errors[i]);
  }
  o << "],";

  o << "\"records\":" << p.stats.records << ",";
  o << "\"bytes\":" << p.stats.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.stats.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.stats.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i = 0; i < p.stats.stages.size(); ++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stats.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(p.stats.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first = true;
  for (const auto& kv : p.stats.errors_by_kind) {
    if (!first) o << ",";
    first = false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";

  o << "}";
  return o.str();
}

}
