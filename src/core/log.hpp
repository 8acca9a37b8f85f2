#pragma once

#include <string>
#include "types.hpp"

// Debug log: <tmp>/shuttle_debug.log, or $SHUTTLE_LOG when set.
std::string shuttle_log_path();

// Append one timestamped line to the debug log.
void shuttle_log(const std::string& msg);

void shuttle_log_exec(const std::string& label, const std::string& cmd, const ExecResult& r);
