#include "csvlint/artifact_writer.hpp"
#include "csvlint/byte_source.hpp"
#include "csvlint/lint_options.hpp"
#include "csvlint/metrics.hpp"
#include "csvlint/path_utils.hpp"
#include "csvlint/report_json.hpp"
#include "csvlint/summary.hpp"
#include "csvlint/validator.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  csvlint::LintOptions lint;
  std::string file;
  std::string report_dir;               // empty: no on-disk report
  std::string slug_mode = "hashprefix"; // hashprefix|basename
  int slug_len = 12;
  bool help = false;
  std::string error;
};

const char* kUsage =
  "Usage: csvlint [--delimiter=D|-d D] [--lazyquotes|-l] [--rfc4180]\n"
  "               [--report-dir=DIR] [--slug-mode=hashprefix|basename] [--slug-len=N]\n"
  "               FILE\n"
  "\n"
  "  -d, --delimiter   field delimiter (e.g. ',' '\\t' '|' ':' ';'), default ','\n"
  "  -l, --lazyquotes  try to parse improperly escaped quotes\n"
  "      --rfc4180     strict RFC 4180 mode (comma delimiter, CRLF line endings)\n"
  "      --report-dir  also write report.json and report.html under DIR/<slug>/\n";

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), *out);
      if (ec != std::errc() || ptr != v.data() + v.size()) c.error = "invalid value for " + a;
      return true;
    };
    if (eat("--delimiter=", &c.lint.delimiter)) continue;
    if ((a == "-d" || a == "--delimiter") && i + 1 < argc) { c.lint.delimiter = argv[++i]; continue; }
    if (a == "-l" || a == "--lazyquotes") { c.lint.lazy_quotes = true; continue; }
    if (a == "--rfc4180") { c.lint.rfc4180 = true; continue; }
    if (eat("--report-dir=", &c.report_dir)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (a == "-h" || a == "--help") { c.help = true; continue; }
    if (!a.empty() && a[0] == '-' && a != "-") { c.error = "unknown option: " + a; continue; }
    if (!c.file.empty()) { c.error = "unexpected argument: " + a; continue; }
    c.file = a;
  }
  return c;
}

void print_strict_banner() {
  std::cout << "Running in strict RFC 4180 compliance mode\n"
            << "- Delimiter: comma (,)\n"
            << "- Line endings: CRLF required\n"
            << "- Quote escaping: strict\n"
            << "\n";
}

void write_report(const Cli& cli,
                  const csvlint::ValidationConfig& cfg,
                  const csvlint::ValidationResult& result,
                  const csvlint::MetricsRegistry& metrics,
                  double wall_ms) {
  csvlint::ReportPayload p;
  p.filename = cli.file;
  std::error_code fec;
  p.file_size = std::filesystem::file_size(cli.file, fec);
  p.delimiter = cfg.delimiter;
  p.lazy_quotes = cfg.lazy_quotes;
  p.strict = cfg.strict;
  p.result = result;
  p.exit_status = static_cast<int>(csvlint::exit_status(result));
  p.stats = metrics.snapshot(wall_ms);

  const std::string key = (cli.slug_mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(cli.file), fec).string()
      : cli.file;
  const std::string slug = csvlint::make_slug(key, cli.slug_mode, cli.slug_len);

  std::string err;
  if (!csvlint::write_report_dir(cli.report_dir, slug, p, &err)) {
    std::cerr << "[report] write_report_dir failed: " << err << "\n";
    return;
  }
  std::cerr << "[report] wrote " << (std::filesystem::path(cli.report_dir) / slug / "report.html").string() << "\n";
}

}

int main(int argc, char** argv) {
  const Cli cli = parse_cli(argc, argv);
  const int failed = static_cast<int>(csvlint::ExitStatus::Failed);

  if (cli.help) { std::cout << kUsage; return 0; }
  if (!cli.error.empty()) { std::cerr << cli.error << "\n" << kUsage; return failed; }
  if (cli.file.empty()) { std::cerr << "missing FILE argument\n" << kUsage; return failed; }

  csvlint::ValidationConfig cfg;
  std::vector<std::string> warnings;
  std::string err;
  const bool resolved = csvlint::resolve_config(cli.lint, cfg, warnings, &err);
  for (const auto& w : warnings) std::cerr << w << "\n";
  if (!resolved) { std::cerr << err << "\n"; return failed; }

  if (cfg.strict) print_strict_banner();

  csvlint::FileByteSource src(cli.file);
  if (!src.open()) {
    if (src.last_error() == ENOENT) {
      std::cerr << "file '" << cli.file << "' does not exist\n";
    } else {
      std::cerr << "error opening file '" << cli.file << "': " << std::strerror(src.last_error()) << "\n";
    }
    return failed;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  csvlint::MetricsRegistry metrics;
  csvlint::ValidationResult result;
  if (!csvlint::validate(src, cfg, result, &err, &metrics)) {
    std::cerr << "validation error: " << err << "\n";
    return failed;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  csvlint::print_summary(std::cout, result, cfg.strict);

  if (!cli.report_dir.empty()) write_report(cli, cfg, result, metrics, wall_ms);

  return static_cast<int>(csvlint::exit_status(result));
}
