#include "csvlint/artifact_writer.hpp"
#include "csvlint/metrics.hpp"
#include "csvlint/mustache_renderer.hpp"
#include "csvlint/report_json.hpp"
#include "csvlint/summary.hpp"
#include "csvlint/validator.hpp"

#include <simdjson.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static csvlint::ReportPayload make_payload() {
  csvlint::ValidationConfig cfg;
  cfg.strict = true;
  csvlint::MetricsRegistry m;
  csvlint::ReportPayload p;
  p.filename = "in \"quoted\".csv";
  p.result = csvlint::validate("a,b\r\n1,2,3\n\"<x>\",\"tab\there\"\r\n", cfg, &m);
  p.file_size = 28;
  p.delimiter = cfg.delimiter;
  p.strict = cfg.strict;
  p.exit_status = static_cast<int>(csvlint::exit_status(p.result));
  p.stats = m.snapshot(2.0);
  return p;
}

int main() {
  const csvlint::ReportPayload p = make_payload();
  if (p.result.errors.size() != 2) {
    std::cerr << "[FAIL] expected 2 errors, got " << p.result.errors.size() << "\n";
    return 1;
  }

  const std::string json = csvlint::ReportJsonWriter::to_json(p);
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  auto doc = parser.iterate(padded);

  bool ok = true;
  std::string_view fname;
  if (doc["filename"].get_string().get(fname) || fname != "in \"quoted\".csv") {
    std::cerr << "[FAIL] filename=" << fname << "\n"; ok = false;
  }
  bool valid = true, halted = true;
  if (doc["valid"].get_bool().get(valid) || valid) { std::cerr << "[FAIL] valid should be false\n"; ok = false; }
  if (doc["halted"].get_bool().get(halted) || halted) { std::cerr << "[FAIL] halted should be false\n"; ok = false; }
  uint64_t status = 0;
  if (doc["exit_status"].get_uint64().get(status) || status != 2) { std::cerr << "[FAIL] exit_status\n"; ok = false; }

  std::size_t n = 0;
  simdjson::ondemand::array errors;
  if (doc["errors"].get_array().get(errors)) { std::cerr << "[FAIL] errors is not an array\n"; return 1; }
  for (auto e : errors) {
    uint64_t rec = 99;
    std::string_view kind;
    if (e["record_num"].get_uint64().get(rec) || e["kind"].get_string().get(kind)) {
      std::cerr << "[FAIL] error " << n << " is malformed\n"; ok = false; ++n; continue;
    }
    if (n == 0 && (kind != "InvalidLineEnding" || rec != 2)) {
      std::cerr << "[FAIL] error 0: " << kind << " #" << rec << "\n"; ok = false;
    }
    if (n == 1) {
      if (kind != "FieldCount" || rec != 1) { std::cerr << "[FAIL] error 1: " << kind << " #" << rec << "\n"; ok = false; }
      std::size_t fields = 0;
      simdjson::ondemand::array rec_fields;
      if (!e["record"].get_array().get(rec_fields)) {
        for (auto f : rec_fields) { (void)f; ++fields; }
      }
      if (fields != 3) { std::cerr << "[FAIL] error 1 fields=" << fields << "\n"; ok = false; }
    }
    ++n;
  }
  if (n != 2) { std::cerr << "[FAIL] errors array size " << n << "\n"; ok = false; }

  uint64_t records = 0;
  if (doc["records"].get_uint64().get(records) || records != 3) { std::cerr << "[FAIL] records=" << records << "\n"; ok = false; }

  uint64_t fc = 0;
  if (doc["errors_by_kind"]["FieldCount"].get_uint64().get(fc) || fc != 1) {
    std::cerr << "[FAIL] errors_by_kind.FieldCount=" << fc << "\n"; ok = false;
  }

  // on-disk report
  const fs::path root = fs::temp_directory_path() / ("csvlint-report-" + std::to_string(std::time(nullptr)));
  std::string err;
  if (!csvlint::write_report_dir(root.string(), "sample", p, &err)) {
    std::cerr << "[FAIL] write_report_dir: " << err << "\n";
    return 1;
  }
  if (!fs::exists(root / "sample" / "report.json")) { std::cerr << "[FAIL] report.json missing\n"; ok = false; }
  {
    std::ifstream in(root / "sample" / "report.html");
    std::ostringstream ss; ss << in.rdbuf();
    const std::string html = ss.str();
    if (html.find("Found 2 validation error(s)") == std::string::npos) {
      std::cerr << "[FAIL] report.html lacks the error count\n"; ok = false;
    }
    if (html.find("&lt;x&gt;") == std::string::npos) {
      std::cerr << "[FAIL] report.html does not escape field contents\n"; ok = false;
    }
  }
  if (!fs::exists(root / "sample" / "report.css")) { std::cerr << "[FAIL] report.css not copied\n"; ok = false; }

  // a missing stylesheet fails the render and names the asset
  {
    csvlint::MustacheRenderer::Config rcfg;
    rcfg.static_css = {"web/css/no_such_theme.css"};
    csvlint::MustacheRenderer r(rcfg);
    const fs::path dir = root / "no-assets";
    if (r.render_to_dir("report.mustache", p, dir.string(), "report.html", true)) {
      std::cerr << "[FAIL] render_to_dir succeeded without its stylesheet\n"; ok = false;
    } else if (r.last_error().find("asset not found: web/css/no_such_theme.css") == std::string::npos) {
      std::cerr << "[FAIL] asset error not reported: " << r.last_error() << "\n"; ok = false;
    }
    if (!fs::exists(dir / "report.html")) { std::cerr << "[FAIL] html not written before asset copy\n"; ok = false; }
  }

  std::error_code ec;
  fs::remove_all(root, ec);

  if (!ok) return 1;
  std::cout << "[PASS] report json/html\n";
  return 0;
}
