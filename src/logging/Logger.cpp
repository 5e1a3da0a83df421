//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
std::atomic<LogLevel> Logger::sLogLevel{LogLevel::LOG_INFO_LEVEL};
// Console goes to stderr when MCPSERVE_STDIO_MODE=1 to avoid corrupting stdout JSON-RPC frames
std::atomic<bool> Logger::sUseStderr{GetEnvBool("MCPSERVE_STDIO_MODE", false)};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
