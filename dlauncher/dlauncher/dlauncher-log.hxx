#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace dlauncher
{
  // Map a --log-level value to the spdlog level. Accepts debug, info,
  // warn/warning, and error (case-insensitive). Anything else is info.
  //
  spdlog::level::level_enum
  parse_log_level (const std::string&);

  // Install the stderr logger as the default spdlog logger.
  //
  // The pattern mimics our plain diagnostics (`warning: ...`) so that log
  // records and errors printed by main() read the same.
  //
  void
  init_log (spdlog::level::level_enum);
}
