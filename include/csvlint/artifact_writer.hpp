#pragma once
#include <string>

namespace csvlint {

struct ReportPayload;

// Writes:
//   <artifact_root>/<slug>/report.json
//   <artifact_root>/<slug>/report.html  (+ report.css)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const ReportPayload& report,
                      std::string* err_out = nullptr);

}
