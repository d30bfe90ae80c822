#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace csvlint {

struct ReportPayload;

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
    std::vector<std::string> static_css;
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  bool render_to_file(std::string_view template_name,
                      const ReportPayload& report,
                      std::string_view out_path);

  bool render_to_dir(std::string_view template_name,
                     const ReportPayload& report,
                     std::string_view out_dir,
                     std::string_view out_name,
                     bool copy_assets);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
