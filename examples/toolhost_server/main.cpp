//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolhost stdio server executable
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/Server.h"
#include "toolhost/ServerContext.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/version.h"
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace toolhost;

//==========================================================================================================
// Returns true when 'flag' appears verbatim among the arguments.
//==========================================================================================================
static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        std::cout << config::UsageText(argv[0]);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << SERVER_NAME << " " << getVersionString() << std::endl;
        return 0;
    }

    config::ServerConfig cfg;
    try {
        cfg = config::ServerConfig::FromEnvironment();
        cfg.ApplyArgs(argc, argv);
        cfg.Validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "toolhost: configuration error: " << e.what() << "\n" << config::UsageText(argv[0]);
        return 2;
    }

    if (!Logger::configure(cfg.logLevel, cfg.logFile.value_or(""))) {
        LOG_WARN("Logging partially configured (level={} file={})", cfg.logLevel, cfg.logFile.value_or("-"));
    }

    std::shared_ptr<ServerContext> context;
    try {
        context = MakeDefaultServerContext(cfg);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return 2;
    }

    auto transport = std::make_unique<StdioTransport>();
    transport->SetMaxContentLength(cfg.maxMessageBytes);

    LOG_INFO("{} {} serving on stdio (root={})", SERVER_NAME, getVersionString(), cfg.sandboxRoot.string());
    Server server(context);
    try {
        server.Serve(std::move(transport));
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }
    LOG_INFO("Server stopped");
    return 0;
}
