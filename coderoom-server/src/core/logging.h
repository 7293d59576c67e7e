// logging.h - Default logger setup
#pragma once

#include <string>

namespace coderoom::server::core {

// Console logger plus an optional file sink. Unknown levels fall back to info.
bool InitLogging(const std::string& level, const std::string& log_file = "");

} // namespace coderoom::server::core
