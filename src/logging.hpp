#pragma once

#include "config.hpp"

namespace quotadash {

// Installs the default spdlog logger: a file sink for the TUI, stderr for snapshot mode.
// Throws spdlog::spdlog_ex when the log file cannot be opened.
void init_logging(const Config& config);

} // namespace quotadash
