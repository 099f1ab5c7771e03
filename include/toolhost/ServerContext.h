//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerContext.h
// Purpose: Per-process bundle of configuration, sandbox, registries, log store and execution supervisor
//==========================================================================================================
#pragma once

#include <memory>
#include <vector>

#include "toolhost/builtin/LogStore.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/execution/ExecutionSupervisor.h"
#include "toolhost/registry/PromptRegistry.h"
#include "toolhost/registry/ResourceRegistry.h"
#include "toolhost/registry/ToolRegistry.h"
#include "toolhost/sandbox/PathSandbox.h"

namespace toolhost {

//==========================================================================================================
// ServerContext
// Purpose: Built once at startup and passed by reference to the dispatcher. Everything except the
//          supervisor and the log store is read-only afterwards.
//==========================================================================================================
class ServerContext {
public:
    //==========================================================================================================
    // Args:
    //   config: Validated here.
    //   sandbox: Shared with filesystem resource strategies.
    //   logs: Run/build log store; the supervisor appends call outcomes to it.
    //   tools, resources, prompts: Registry contents.
    // Throws:
    //   std::invalid_argument for invalid configuration or registry contents.
    //==========================================================================================================
    ServerContext(config::ServerConfig config,
                  std::shared_ptr<const PathSandbox> sandbox,
                  std::shared_ptr<LogStore> logs,
                  std::vector<ToolDefinition> tools,
                  std::vector<std::shared_ptr<IResourceStrategy>> resources,
                  std::vector<PromptDefinition> prompts);

    const config::ServerConfig& Config() const { return config; }
    const ToolRegistry& Tools() const { return tools; }
    const ResourceRegistry& Resources() const { return resources; }
    const PromptRegistry& Prompts() const { return prompts; }
    ExecutionSupervisor& Supervisor() { return *supervisor; }

private:
    config::ServerConfig config;
    std::shared_ptr<const PathSandbox> sandbox;
    std::shared_ptr<LogStore> logs;
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    std::unique_ptr<ExecutionSupervisor> supervisor;
};

//==========================================================================================================
// MakeDefaultServerContext
// Purpose: Context with the built-in kinds (echo tool, workspace:// and logs:// resources,
//          scaffold.page prompt) plus any extra tools.
// Throws:
//   std::invalid_argument for invalid configuration.
//==========================================================================================================
std::unique_ptr<ServerContext> MakeDefaultServerContext(config::ServerConfig config,
                                                        std::vector<ToolDefinition> extraTools = {});

} // namespace toolhost
