#pragma once

#include "registry.h"

namespace sqlterm::cli {

CommandHandler make_export_command();

}  // namespace sqlterm::cli
