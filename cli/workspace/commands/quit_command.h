#pragma once

#include "registry.h"

namespace sqlterm::cli {

CommandHandler make_quit_command();

}  // namespace sqlterm::cli
