#include "csvlint/mustache_renderer.hpp"
#include "csvlint/path_utils.hpp"
#include "csvlint/report_json.hpp"
#include "csvlint/summary.hpp"

#include <kainjow/mustache.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace csvlint {

namespace mstch = kainjow::mustache;

MustacheRenderer::MustacheRenderer() : cfg_{} {}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static std::string read_file(const std::string& path, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err += "open failed: " + path + "\n"; return {}; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// naive "{{> name}}" inliner that looks for partial files in partials_dir
static std::string inline_partials(std::string tpl,
                                   const std::filesystem::path& partials_dir,
                                   std::string& err) {
  size_t pos = 0;
  while ((pos = tpl.find("{{>", pos)) != std::string::npos) {
    size_t name_start = pos + 3;
    while (name_start < tpl.size() && std::isspace(static_cast<unsigned char>(tpl[name_start])))
      ++name_start;
    size_t close = tpl.find("}}", name_start);
    if (close == std::string::npos) break;

    size_t name_end = close;
    while (name_end > name_start &&
           std::isspace(static_cast<unsigned char>(tpl[name_end - 1])))
      --name_end;

    std::string partial_name = tpl.substr(name_start, name_end - name_start);
    if (partial_name.empty()) { pos = close + 2; continue; }

    std::string perr;
    std::string content = read_file((partials_dir / (partial_name + ".mustache")).string(), perr);
    if (content.empty()) {
      err += "partial not found: " + partial_name + "\n";
      pos = close + 2;
      continue;
    }

    tpl.replace(pos, (close + 2) - pos, content);
    pos += content.size();
  }
  return tpl;
}

static bool copy_one_asset(const std::filesystem::path& src_hint,
                           const std::filesystem::path& out_dir,
                           std::string& err) {
  std::error_code ec;
  std::vector<std::filesystem::path> candidates;
  candidates.emplace_back(src_hint);
#ifdef CSVLINT_DEFAULT_STATIC_DIR
  candidates.emplace_back(std::filesystem::path(CSVLINT_DEFAULT_STATIC_DIR) / src_hint.filename());
#endif

  std::filesystem::path src{};
  for (auto& c : candidates) {
    if (std::filesystem::exists(c, ec)) { src = c; break; }
  }
  if (src.empty()) {
    err += "asset not found: " + src_hint.string() + "\n";
    return false;
  }

  auto dst = out_dir / src.filename();
  std::filesystem::copy_file(src, dst,
      std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    err += "copy failed: " + src.string() + " -> " + dst.string() + " (" + ec.message() + ")\n";
    return false;
  }
  return true;
}

static mstch::data flag(bool b) {
  return mstch::data(b ? mstch::data::type::bool_true : mstch::data::type::bool_false);
}

static std::string delimiter_label(char d) {
  if (d == '\t') return "\\t";
  return std::string(1, d);
}

static mstch::data to_view(const ReportPayload& p) {
  mstch::data view;
  view.set("filename", p.filename);
  view.set("file_size", std::to_string(p.file_size));
  view.set("delimiter", delimiter_label(p.delimiter));
  view.set("lazy_quotes", flag(p.lazy_quotes));
  view.set("rfc4180", flag(p.strict));
  view.set("valid", flag(p.result.ok()));
  view.set("halted", flag(p.result.halted));
  view.set("exit_status", std::to_string(p.exit_status));
  view.set("error_count", std::to_string(p.result.errors.size()));

  const ErrorTally t = tally(p.result);
  view.set("field_count_errors", std::to_string(t.field_count));
  view.set("line_ending_errors", std::to_string(t.line_ending));
  view.set("quote_errors", std::to_string(t.quote));
  view.set("other_errors", std::to_string(t.other));

  mstch::data errors{mstch::data::type::list};
  for (const auto& e : p.result.errors) {
    mstch::data row;
    row.set("record_num", std::to_string(e.record_num));
    row.set("kind", std::string(kind_name(e.kind)));
    row.set("message", describe(e.kind));
    if (e.record) {
      mstch::data fields{mstch::data::type::list};
      for (const auto& f : *e.record) fields.push_back(mstch::data(f));
      row.set("fields", fields);
      row.set("has_record", flag(true));
    } else {
      row.set("has_record", flag(false));
    }
    errors.push_back(row);
  }
  view.set("errors", errors);

  view.set("records", std::to_string(p.stats.records));
  view.set("bytes", std::to_string(p.stats.bytes));
  {
    std::ostringstream ms; ms << p.stats.wall_time_ms;
    view.set("wall_time_ms", ms.str());
  }
  mstch::data stages{mstch::data::type::list};
  for (const auto& s : p.stats.stages) {
    mstch::data row;
    row.set("stage", s.name);
    std::ostringstream ms; ms << s.duration_ms;
    row.set("duration_ms", ms.str());
    stages.push_back(row);
  }
  view.set("stages", stages);
  return view;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const ReportPayload& report,
                                      std::string_view out_path) {
  err_.clear();

  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / std::string(template_name)).string();

  std::string tpl = read_file(tpl_path, err_);
  if (tpl.empty() && !err_.empty()) return false;

  tpl = inline_partials(std::move(tpl), std::filesystem::path(cfg_.partials_dir), err_);

  mstch::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  const std::string rendered = view.render(to_view(report));
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  if (!ensure_parent_dirs(std::filesystem::path(out_path))) { err_ = "mkdir -p failed"; return false; }

  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return true;
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const ReportPayload& report,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool copy_assets) {
  err_.clear();
  const std::filesystem::path outdir{std::string(out_dir)};
  const std::filesystem::path outpath = outdir / std::string(out_name);

  if (!render_to_file(template_name, report, outpath.string())) {
    return false; // err_ set
  }
  if (!copy_assets) return true;

  std::vector<std::string> css = cfg_.static_css.empty()
      ? std::vector<std::string>{"web/css/report.css"}
      : cfg_.static_css;
  // Copy every asset even after a failure so err_ lists all of them.
  bool copied = true;
  for (auto& s : css) {
    if (!copy_one_asset(std::filesystem::path(s), outdir, err_)) copied = false;
  }
  return copied;
}

}
