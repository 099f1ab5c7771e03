//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static members, level parsing and startup configuration
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

bool Logger::levelFromString(const std::string& lvl, LogLevel& out) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "debug") { out = LogLevel::LOG_DEBUG_LEVEL; return true; }
    if (s == "info")  { out = LogLevel::LOG_INFO_LEVEL; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::LOG_WARN_LEVEL; return true; }
    if (s == "error") { out = LogLevel::LOG_ERROR_LEVEL; return true; }
    if (s == "fatal") { out = LogLevel::LOG_FATAL_LEVEL; return true; }
    return false;
}

bool Logger::configure(const std::string& levelName, const std::string& filePath) {
    bool ok = true;
    LogLevel level = LogLevel::LOG_INFO_LEVEL;
    if (levelFromString(levelName, level)) {
        setLogLevel(level);
    } else {
        std::cerr << "[WARN] Unknown log level '" << levelName << "', keeping the current level" << std::endl;
        ok = false;
    }
    // Empty path keeps console-only output
    if (!filePath.empty() && !setLogFile(filePath)) {
        ok = false;
    }
    return ok;
}
