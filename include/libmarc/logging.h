#pragma once

#include "types.h"

#include <string>

namespace libmarc {

// Apply SPDLOG_LEVEL from the environment to the default logger
// (e.g. SPDLOG_LEVEL=debug). Call once at startup; later calls re-read it.
void init_logging();

// Replace the default logger with one writing to path, truncating it.
// Library log lines (producer lifecycle, pool sizing, stream errors) then
// land in that file.
Result<void> log_to_file(const std::string& path, bool debug = false);

// Restore the stderr default logger installed by spdlog.
void reset_logging();

} // namespace libmarc
