#include "goto_command.h"

#include <sstream>

#include "sqlterm/result_grid.h"
#include "util/string_util.h"

namespace sqlterm::cli {

CommandHandler make_goto_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    if (cmd != ":goto") {
      return false;
    }
    if (ctx.grid.empty()) {
      ctx.status = "No rows to navigate";
      ctx.status_error = true;
      return true;
    }
    size_t row = 0;
    if (!sqlterm::util::parse_positive_size(value, row)) {
      ctx.status = "Usage: :goto <row> (1-based)";
      ctx.status_error = true;
      return true;
    }
    ctx.grid.jump_to_absolute_row(row - 1);
    ctx.status = "Row " + std::to_string(*ctx.grid.selected_row() + 1) + " of " +
                 std::to_string(ctx.grid.row_count());
    ctx.status_error = false;
    return true;
  };
}

}  // namespace sqlterm::cli
