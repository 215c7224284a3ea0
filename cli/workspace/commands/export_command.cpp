#include "export_command.h"

#include <sstream>

#include "export/export_sinks.h"
#include "sqlterm/result_grid.h"
#include "util/string_util.h"
#include "workspace/config.h"

namespace sqlterm::cli {

CommandHandler make_export_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (sqlterm::util::first_token(line) != ":export") {
      return false;
    }
    std::string path = sqlterm::util::trim_ws(line.substr(line.find(":export") + 7));
    if (path.size() >= 2 && (path.front() == '\'' || path.front() == '"') &&
        path.back() == path.front()) {
      path = path.substr(1, path.size() - 2);
    }
    if (path.empty()) {
      ctx.status = "Usage: :export <path.csv|path.parquet>";
      ctx.status_error = true;
      return true;
    }
    path = expand_user_path(path);
    std::string error;
    if (!export_rows(ctx.grid.headers(), ctx.grid.rows(), path, error)) {
      ctx.status = "Export failed: " + error;
      ctx.status_error = true;
      return true;
    }
    std::ostringstream oss;
    oss << "Wrote " << export_kind_label(export_kind_for_path(path)) << ": " << path << " ("
        << ctx.grid.row_count() << " rows)";
    ctx.status = oss.str();
    ctx.status_error = false;
    return true;
  };
}

}  // namespace sqlterm::cli
