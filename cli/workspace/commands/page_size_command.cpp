#include "page_size_command.h"

#include <sstream>

#include "sqlterm/result_grid.h"
#include "util/string_util.h"
#include "workspace/core/workspace.h"

namespace sqlterm::cli {

CommandHandler make_page_size_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line.rfind(":pagesize", 0) != 0) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    if (cmd != ":pagesize") {
      return false;
    }
    if (value.empty()) {
      ctx.status = "Page size: " + std::to_string(ctx.grid.page_size());
      ctx.status_error = false;
      return true;
    }
    size_t parsed = 0;
    if (!sqlterm::util::parse_positive_size(value, parsed)) {
      ctx.status = "Usage: :pagesize <n> (n > 0)";
      ctx.status_error = true;
      return true;
    }
    ctx.grid.set_page_size(parsed);
    ctx.config.page_size = parsed;
    ctx.status = "Page size: " + std::to_string(ctx.grid.page_size());
    ctx.status_error = false;
    return true;
  };
}

}  // namespace sqlterm::cli
