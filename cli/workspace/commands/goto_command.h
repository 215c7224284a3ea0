#pragma once

#include "registry.h"

namespace sqlterm::cli {

CommandHandler make_goto_command();

}  // namespace sqlterm::cli
