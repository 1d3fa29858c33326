#pragma once
/*
 * DebugLog
 *
 * Purpose: opt-in trace of prompt state transitions to a file.
 * Usage: set MPROMPT_LOG=<path>; nothing is ever written to the terminal.
 */
#include <string>

void debug_log(const std::string& line);
