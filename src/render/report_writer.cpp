#include "bcp_exorcist/run_json.hpp"
#include "bcp_exorcist/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace bx {

bool write_report_file(const std::string& report_dir,
                       const std::string& slug,
                       const std::string& json,
                       std::string* err_out) {
  const std::filesystem::path out = std::filesystem::path(report_dir) / (slug + ".json");

  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "failed to create " + out.parent_path().string();
    return false;
  }

  std::ofstream rj(out, std::ios::binary | std::ios::trunc);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + out.string();
    return false;
  }
  rj.write(json.data(), static_cast<std::streamsize>(json.size()));
  rj.put('\n');
  rj.flush();
  if (!rj) {
    if (err_out) *err_out = "failed to write " + out.string();
    return false;
  }
  return true;
}

}
