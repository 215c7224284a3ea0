#include "quit_command.h"

namespace sqlterm::cli {

CommandHandler make_quit_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line != ":quit" && line != ":q" && line != ":exit") {
      return false;
    }
    ctx.quit = true;
    return true;
  };
}

}  // namespace sqlterm::cli
