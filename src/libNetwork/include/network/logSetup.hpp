#pragma once

#include "Logger/LogConfig.hpp"

#include <string>

namespace ttt::network {

//! Enable logging of any entries to <default log dir>/<logDir>/log.txt + console (for debug builds).
//! \note If the log directory cannot be created, only the console output is added.
void InitializeLogConfig(Logging::LogConfig& config, const std::string& logDir);

} // namespace ttt::network
