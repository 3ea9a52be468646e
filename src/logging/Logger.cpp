//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCP_LOG_LEVEL", "info"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
