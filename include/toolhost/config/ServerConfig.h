//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration: limits, timeouts, concurrency, sandbox rules and logging options
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {
namespace config {

//==========================================================================================================
// SizeLimits
// Purpose: Byte limits applied to tool arguments, tool results and resource reads.
//==========================================================================================================
struct SizeLimits {
    std::size_t maxParameterBytes = 1024 * 1024;
    std::size_t maxResultBytes = 10 * 1024 * 1024;
    std::size_t maxResourceBytes = 50 * 1024 * 1024;
};

//==========================================================================================================
// SecurityConfig
// Purpose: Allow/deny rules for filesystem-backed resources.
// Fields:
//   deniedDirectories: Directory names that deny any path containing them as a component.
//   allowedFileSuffixes/allowedFileNames: When either is set, only matching files are readable.
//==========================================================================================================
struct SecurityConfig {
    std::vector<std::string> deniedDirectories{".git", ".dart_tool", "build"};
    std::optional<std::vector<std::string>> allowedFileSuffixes;
    std::optional<std::vector<std::string>> allowedFileNames;
};

//==========================================================================================================
// ServerConfig
// Purpose: Immutable-after-startup settings consumed by the server context.
// Notes:
//   Load order is defaults, then TOOLHOST_* environment variables (FromEnvironment), then command line
//   options (ApplyArgs). Call Validate() after loading.
//==========================================================================================================
struct ServerConfig {
    std::filesystem::path sandboxRoot;
    std::size_t maxMessageBytes = 2 * 1024 * 1024;
    std::chrono::milliseconds defaultTimeout{300000};
    std::size_t maxConcurrency = 10;
    std::size_t maxQueuedCalls = 64;
    std::size_t workerThreads = 0; // 0 = 2 x maxConcurrency
    std::map<std::string, std::chrono::milliseconds> perToolTimeouts;
    std::map<std::string, std::size_t> perToolConcurrency;
    SizeLimits sizeLimits;
    SecurityConfig security;
    std::string logLevel = "info";
    std::optional<std::string> logFile;

    ServerConfig();

    std::size_t EffectiveWorkerThreads() const;

    //==========================================================================================================
    // Validate
    // Purpose: Rejects inconsistent settings.
    // Throws:
    //   std::invalid_argument naming the offending setting.
    //==========================================================================================================
    void Validate() const;

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overlaid with TOOLHOST_* environment variables.
    // Throws:
    //   std::invalid_argument on malformed values.
    //==========================================================================================================
    static ServerConfig FromEnvironment();

    //==========================================================================================================
    // ApplyArgs
    // Purpose: Overlays --key=value command line options. --help and --version are left to the caller
    //          and skipped here.
    // Throws:
    //   std::invalid_argument on unknown options or malformed values.
    //==========================================================================================================
    void ApplyArgs(int argc, char** argv);

    // Apply one option by its long name without dashes (e.g. "timeout-ms").
    void ApplyOption(const std::string& key, const std::string& value);
};

// Usage text for --help.
std::string UsageText(const char* program);

// "a,b, c" -> {"a","b","c"}; empty items are dropped.
std::vector<std::string> SplitList(const std::string& s);

} // namespace config
} // namespace toolhost
