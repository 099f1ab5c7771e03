//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool definitions and the immutable name -> definition lookup table
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/execution/ProgressReporter.h"

namespace toolhost {

//==========================================================================================================
// ToolHandler
// Purpose: Executes one tool call. The stop_token is signalled on timeout or cancellation; honoring it
//          is the handler's responsibility. Exceptions (thrown or stored in the future) become
//          InternalError responses. 'progress' sends notifications/progress when the caller asked for
//          them and does nothing otherwise.
//==========================================================================================================
using ToolHandler = std::function<std::future<ToolResult>(const JSONValue& arguments, std::stop_token st,
                                                          ProgressReporter progress)>;

struct ToolAnnotations {
    bool readOnly = false;
    bool idempotent = false;
    bool requiresConfirmation = false;
};

//==========================================================================================================
// ToolDefinition
// Fields:
//   name: Unique key.
//   inputSchema: JSON Schema for 'arguments' (object schema).
//   timeout: Per-tool timeout; the registry fills it with the configured default when unset.
//   maxConcurrency: Optional per-tool cap, never above the global cap.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    ToolHandler handler;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::size_t> maxConcurrency;
    ToolAnnotations annotations;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Built once at startup; read-only afterwards and safe to share across threads.
//==========================================================================================================
class ToolRegistry {
public:
    //==========================================================================================================
    // Args:
    //   tools: Definitions to register.
    //   config: Supplies default timeout, global cap and per-tool overrides (overrides win over the
    //           definition's own values).
    // Throws:
    //   std::invalid_argument on empty or duplicate names, missing handlers, or a per-tool cap that is
    //   zero or above the global cap.
    //==========================================================================================================
    ToolRegistry(std::vector<ToolDefinition> tools, const config::ServerConfig& config);

    // Definition for 'name', or nullptr when not registered.
    std::shared_ptr<const ToolDefinition> Find(const std::string& name) const;

    // All definitions ordered by name.
    std::vector<std::shared_ptr<const ToolDefinition>> List() const;

    bool Empty() const { return tools.empty(); }
    std::size_t Size() const { return tools.size(); }

    // {name, description, inputSchema, schema, annotations} entry for tools/list.
    static JSONValue Describe(const ToolDefinition& def);

private:
    std::map<std::string, std::shared_ptr<const ToolDefinition>> tools;
};

} // namespace toolhost
