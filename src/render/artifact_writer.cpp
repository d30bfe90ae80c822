#include "csvlint/artifact_writer.hpp"
#include "csvlint/mustache_renderer.hpp"
#include "csvlint/report_json.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace csvlint {

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const ReportPayload& report,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
      return false;
    }
    const std::string json = ReportJsonWriter::to_json(report);
    std::ofstream rj(out_dir / "report.json", std::ios::binary);
    if (!rj) {
      if (err_out) *err_out = "failed to write report.json";
      return false;
    }
    rj.write(json.data(), static_cast<std::streamsize>(json.size()));
  }

  MustacheRenderer::Config rcfg;
#ifdef CSVLINT_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = CSVLINT_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.static_css   = {"web/css/report.css"};

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("report.mustache",
                                         report,
                                         out_dir.string(),
                                         "report.html",
                                         /*copy_assets=*/true);
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
