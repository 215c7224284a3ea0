#include "help_command.h"

namespace sqlterm::cli {

CommandHandler make_help_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line != ":help" && line != ":h") {
      return false;
    }
    ctx.status =
        "F5/C-g run  Tab focus  C-q quit | grid: j/k rows h/l cols </> scroll [/] page g/G "
        "first/last w/W width y cell Y row\n"
        ":export <path>  :pagesize <n>  :goto <row>  :help  :quit";
    ctx.status_error = false;
    return true;
  };
}

}  // namespace sqlterm::cli
