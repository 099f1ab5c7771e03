//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment/CLI loading and validation for ServerConfig
//==========================================================================================================

#include "toolhost/config/ServerConfig.h"

#include <charconv>
#include <format>
#include <stdexcept>
#include <system_error>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolhost {
namespace config {

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::size_t parseSize(const std::string& key, const std::string& value) {
    const std::string v = trim(value);
    unsigned long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size()) {
        throw std::invalid_argument(std::format("{}: expected a non-negative integer, got '{}'", key, value));
    }
    return static_cast<std::size_t>(out);
}

// "name:value,name2:value2"
std::map<std::string, std::size_t> parseNamedList(const std::string& key, const std::string& value) {
    std::map<std::string, std::size_t> out;
    for (const auto& item : SplitList(value)) {
        const auto colon = item.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::invalid_argument(std::format("{}: expected name:value, got '{}'", key, item));
        }
        out[trim(item.substr(0, colon))] = parseSize(key, item.substr(colon + 1));
    }
    return out;
}

} // namespace

std::vector<std::string> SplitList(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = trim(s.substr(start, comma - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}

ServerConfig::ServerConfig() {
    std::error_code ec;
    sandboxRoot = std::filesystem::current_path(ec);
    if (ec) {
        sandboxRoot = ".";
    }
}

std::size_t ServerConfig::EffectiveWorkerThreads() const {
    return workerThreads > 0 ? workerThreads : 2 * maxConcurrency;
}

void ServerConfig::ApplyOption(const std::string& key, const std::string& value) {
    if (key == "root") {
        sandboxRoot = value;
    } else if (key == "max-message-bytes") {
        maxMessageBytes = parseSize(key, value);
    } else if (key == "timeout-ms") {
        defaultTimeout = std::chrono::milliseconds(parseSize(key, value));
    } else if (key == "max-concurrency") {
        maxConcurrency = parseSize(key, value);
    } else if (key == "max-queued") {
        maxQueuedCalls = parseSize(key, value);
    } else if (key == "worker-threads") {
        workerThreads = parseSize(key, value);
    } else if (key == "tool-timeouts") {
        perToolTimeouts.clear();
        for (const auto& [name, ms] : parseNamedList(key, value)) {
            perToolTimeouts[name] = std::chrono::milliseconds(ms);
        }
    } else if (key == "tool-concurrency") {
        perToolConcurrency = parseNamedList(key, value);
    } else if (key == "max-param-bytes") {
        sizeLimits.maxParameterBytes = parseSize(key, value);
    } else if (key == "max-result-bytes") {
        sizeLimits.maxResultBytes = parseSize(key, value);
    } else if (key == "max-resource-bytes") {
        sizeLimits.maxResourceBytes = parseSize(key, value);
    } else if (key == "deny-dirs") {
        security.deniedDirectories = SplitList(value);
    } else if (key == "allow-suffixes") {
        security.allowedFileSuffixes = SplitList(value);
    } else if (key == "allow-names") {
        security.allowedFileNames = SplitList(value);
    } else if (key == "log-level") {
        logLevel = value;
    } else if (key == "log-file") {
        if (value.empty()) logFile.reset(); else logFile = value;
    } else {
        throw std::invalid_argument(std::format("unknown option --{}", key));
    }
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    static const std::pair<const char*, const char*> kEnvMap[] = {
        {"TOOLHOST_ROOT", "root"},
        {"TOOLHOST_MAX_MESSAGE_BYTES", "max-message-bytes"},
        {"TOOLHOST_TIMEOUT_MS", "timeout-ms"},
        {"TOOLHOST_MAX_CONCURRENCY", "max-concurrency"},
        {"TOOLHOST_MAX_QUEUED", "max-queued"},
        {"TOOLHOST_WORKER_THREADS", "worker-threads"},
        {"TOOLHOST_TOOL_TIMEOUTS", "tool-timeouts"},
        {"TOOLHOST_TOOL_CONCURRENCY", "tool-concurrency"},
        {"TOOLHOST_DENY_DIRS", "deny-dirs"},
        {"TOOLHOST_ALLOW_SUFFIXES", "allow-suffixes"},
        {"TOOLHOST_ALLOW_NAMES", "allow-names"},
        {"TOOLHOST_LOG_LEVEL", "log-level"},
        {"TOOLHOST_LOG_FILE", "log-file"},
    };
    for (const auto& [env, key] : kEnvMap) {
        const auto v = GetEnvIfSet(env);
        if (!v.has_value()) continue;
        try {
            cfg.ApplyOption(key, v.value());
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::format("{}: {}", env, e.what()));
        }
    }
    return cfg;
}

void ServerConfig::ApplyArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--help" || arg == "-h" || arg == "--version") {
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument(std::format("unexpected argument '{}'", arg));
        }
        const auto eq = arg.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(std::format("option '{}' requires a value (--key=value)", arg));
        }
        ApplyOption(arg.substr(2, eq - 2), arg.substr(eq + 1));
    }
}

void ServerConfig::Validate() const {
    if (maxMessageBytes == 0) {
        throw std::invalid_argument("max-message-bytes must be positive");
    }
    if (defaultTimeout.count() <= 0) {
        throw std::invalid_argument("timeout-ms must be positive");
    }
    if (maxConcurrency == 0) {
        throw std::invalid_argument("max-concurrency must be positive");
    }
    if (maxQueuedCalls == 0) {
        throw std::invalid_argument("max-queued must be positive");
    }
    if (sizeLimits.maxParameterBytes == 0 || sizeLimits.maxResultBytes == 0 || sizeLimits.maxResourceBytes == 0) {
        throw std::invalid_argument("size limits must be positive");
    }
    if (sizeLimits.maxParameterBytes > maxMessageBytes) {
        throw std::invalid_argument(std::format("max-param-bytes ({}) exceeds max-message-bytes ({})",
                                                sizeLimits.maxParameterBytes, maxMessageBytes));
    }
    for (const auto& [name, ms] : perToolTimeouts) {
        if (ms.count() <= 0) {
            throw std::invalid_argument(std::format("tool-timeouts: timeout for '{}' must be positive", name));
        }
    }
    for (const auto& [name, cap] : perToolConcurrency) {
        if (cap == 0 || cap > maxConcurrency) {
            throw std::invalid_argument(std::format("tool-concurrency: cap for '{}' must be in [1, {}], got {}",
                                                    name, maxConcurrency, cap));
        }
    }
    LogLevel ignored;
    if (!Logger::levelFromString(logLevel, ignored)) {
        throw std::invalid_argument(std::format("log-level: unknown level '{}'", logLevel));
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(sandboxRoot, ec)) {
        throw std::invalid_argument(std::format("root '{}' is not an existing directory", sandboxRoot.string()));
    }
}

std::string UsageText(const char* program) {
    return std::format(
        "Usage: {} [--key=value ...]\n"
        "  --root=DIR                 sandbox root (default: current directory)\n"
        "  --max-message-bytes=N      largest accepted message body (default 2097152)\n"
        "  --timeout-ms=N             default tool timeout (default 300000)\n"
        "  --max-concurrency=N        global cap on running tool calls (default 10)\n"
        "  --max-queued=N             calls allowed to wait for a slot (default 64)\n"
        "  --worker-threads=N         handler threads (default 2 x max-concurrency)\n"
        "  --tool-timeouts=name:ms,.. per-tool timeout overrides\n"
        "  --tool-concurrency=name:n  per-tool concurrency caps\n"
        "  --max-param-bytes=N        tool argument limit (default 1048576)\n"
        "  --max-result-bytes=N       tool result limit (default 10485760)\n"
        "  --max-resource-bytes=N     whole-resource read limit (default 52428800)\n"
        "  --deny-dirs=a,b            denied directory names (default .git,.dart_tool,build)\n"
        "  --allow-suffixes=a,b       readable file suffixes\n"
        "  --allow-names=a,b          readable file names\n"
        "  --log-level=LEVEL          debug|info|warn|error (default info)\n"
        "  --log-file=PATH            also append logs to PATH\n"
        "  --version                  print version and exit\n"
        "Environment: TOOLHOST_<OPTION> (e.g. TOOLHOST_TIMEOUT_MS) is read before the command line.\n",
        program ? program : "toolhost_server");
}

} // namespace config
} // namespace toolhost
