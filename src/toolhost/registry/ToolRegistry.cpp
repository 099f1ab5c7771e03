//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: ToolRegistry construction and lookup
//==========================================================================================================

#include "toolhost/registry/ToolRegistry.h"

#include <format>
#include <stdexcept>

#include "logging/Logger.h"

namespace toolhost {

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> defs, const config::ServerConfig& config) {
    FUNC_SCOPE();
    for (auto& def : defs) {
        if (def.name.empty()) {
            throw std::invalid_argument("tool name must not be empty");
        }
        if (!def.handler) {
            throw std::invalid_argument(std::format("tool '{}' has no handler", def.name));
        }
        if (tools.count(def.name) != 0) {
            throw std::invalid_argument(std::format("duplicate tool '{}'", def.name));
        }
        if (auto it = config.perToolTimeouts.find(def.name); it != config.perToolTimeouts.end()) {
            def.timeout = it->second;
        }
        if (!def.timeout.has_value()) {
            def.timeout = config.defaultTimeout;
        }
        if (auto it = config.perToolConcurrency.find(def.name); it != config.perToolConcurrency.end()) {
            def.maxConcurrency = it->second;
        }
        if (def.maxConcurrency.has_value() &&
            (def.maxConcurrency.value() == 0 || def.maxConcurrency.value() > config.maxConcurrency)) {
            throw std::invalid_argument(std::format("tool '{}': concurrency cap {} must be in [1, {}]",
                                                    def.name, def.maxConcurrency.value(), config.maxConcurrency));
        }
        LOG_DEBUG("Registered tool {} (timeout={}ms cap={})", def.name, def.timeout->count(),
                  def.maxConcurrency.has_value() ? std::to_string(def.maxConcurrency.value()) : std::string("global"));
        std::string name = def.name;
        tools.emplace(std::move(name), std::make_shared<const ToolDefinition>(std::move(def)));
    }
    for (const auto& [name, ms] : config.perToolTimeouts) {
        if (tools.count(name) == 0) {
            LOG_WARN("Timeout override for unknown tool '{}' ignored", name);
        }
    }
    for (const auto& [name, cap] : config.perToolConcurrency) {
        if (tools.count(name) == 0) {
            LOG_WARN("Concurrency override for unknown tool '{}' ignored", name);
        }
    }
}

std::shared_ptr<const ToolDefinition> ToolRegistry::Find(const std::string& name) const {
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const ToolDefinition>> ToolRegistry::List() const {
    std::vector<std::shared_ptr<const ToolDefinition>> out;
    out.reserve(tools.size());
    for (const auto& [name, def] : tools) {
        out.push_back(def);
    }
    return out;
}

JSONValue ToolRegistry::Describe(const ToolDefinition& def) {
    JSONValue::Object annotations;
    annotations["readOnlyHint"] = std::make_shared<JSONValue>(def.annotations.readOnly);
    annotations["idempotentHint"] = std::make_shared<JSONValue>(def.annotations.idempotent);
    annotations["requiresConfirmation"] = std::make_shared<JSONValue>(def.annotations.requiresConfirmation);

    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(def.name);
    obj["description"] = std::make_shared<JSONValue>(def.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(def.inputSchema);
    obj["schema"] = std::make_shared<JSONValue>(def.inputSchema);
    obj["annotations"] = std::make_shared<JSONValue>(std::move(annotations));
    return JSONValue{std::move(obj)};
}

} // namespace toolhost
