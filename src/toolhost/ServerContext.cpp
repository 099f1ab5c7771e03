//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerContext.cpp
// Purpose: Server context construction and built-in wiring
//==========================================================================================================

#include "toolhost/ServerContext.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/builtin/Builtins.h"
#include "toolhost/builtin/WorkspaceResourceStrategy.h"

namespace toolhost {

namespace {
// Validates before any member is built so registries see consistent limits.
config::ServerConfig validated(config::ServerConfig cfg) {
    cfg.Validate();
    return cfg;
}
} // namespace

ServerContext::ServerContext(config::ServerConfig cfg,
                             std::shared_ptr<const PathSandbox> sb,
                             std::shared_ptr<LogStore> logStore,
                             std::vector<ToolDefinition> toolList,
                             std::vector<std::shared_ptr<IResourceStrategy>> resourceList,
                             std::vector<PromptDefinition> promptList)
    : config(validated(std::move(cfg))),
      sandbox(std::move(sb)),
      logs(std::move(logStore)),
      tools(std::move(toolList), config),
      resources(std::move(resourceList)),
      prompts(std::move(promptList)) {
    if (!sandbox || !logs) {
        throw std::invalid_argument("ServerContext requires a sandbox and a log store");
    }
    supervisor = std::make_unique<ExecutionSupervisor>(config, logs);
    LOG_INFO("ServerContext: root={} tools={} resourcePrefixes={} prompts={}",
             sandbox->Root().string(), tools.Size(), resources.Prefixes().size(), prompts.List().size());
    for (const auto& prefix : resources.Prefixes()) {
        const auto strategy = resources.Find(prefix);
        LOG_DEBUG("ServerContext: resource {} ({}{})", prefix, strategy->Description(),
                  strategy->ReadOnly() ? ", read-only" : "");
    }
}

std::unique_ptr<ServerContext> MakeDefaultServerContext(config::ServerConfig config,
                                                        std::vector<ToolDefinition> extraTools) {
    FUNC_SCOPE();
    config.Validate();
    auto sandbox = std::make_shared<PathSandbox>(config.sandboxRoot, config.security);
    auto logs = std::make_shared<LogStore>();

    std::vector<ToolDefinition> tools;
    tools.push_back(builtin::MakeEchoTool());
    for (auto& t : extraTools) {
        tools.push_back(std::move(t));
    }

    std::vector<std::shared_ptr<IResourceStrategy>> resources;
    resources.push_back(std::make_shared<WorkspaceResourceStrategy>(sandbox, config.sizeLimits.maxResourceBytes));
    resources.push_back(std::make_shared<LogResourceStrategy>(logs));

    std::vector<PromptDefinition> prompts;
    prompts.push_back(builtin::MakeScaffoldPagePrompt());

    return std::make_unique<ServerContext>(std::move(config), std::move(sandbox), std::move(logs),
                                           std::move(tools), std::move(resources), std::move(prompts));
}

} // namespace toolhost
