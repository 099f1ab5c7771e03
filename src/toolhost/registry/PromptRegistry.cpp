//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.cpp
// Purpose: Prompt lookup, variable resolution and rendering
//==========================================================================================================

#include "toolhost/registry/PromptRegistry.h"

#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
// Scalar JSON value as prompt text; nullopt for null, arrays and objects.
std::optional<std::string> scalarText(const JSONValue& v) {
    return std::visit([](const auto& x) -> std::optional<std::string> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(x ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return SerializeJSONValue(JSONValue(x));
        } else {
            return std::nullopt;
        }
    }, v.value);
}
} // namespace

JSONValue PromptOutcome::ToJSON() const {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(id);
    if (text.has_value()) {
        obj["text"] = std::make_shared<JSONValue>(text.value());
    } else {
        JSONValue::Array needed;
        for (const auto& n : variablesNeeded) {
            needed.push_back(std::make_shared<JSONValue>(n));
        }
        obj["variablesNeeded"] = std::make_shared<JSONValue>(std::move(needed));
    }
    return JSONValue{std::move(obj)};
}

PromptRegistry::PromptRegistry(std::vector<PromptDefinition> list) {
    FUNC_SCOPE();
    for (auto& def : list) {
        if (def.id.empty()) {
            throw std::invalid_argument("prompt id must not be empty");
        }
        if (!def.render) {
            throw std::invalid_argument(std::format("prompt '{}' has no renderer", def.id));
        }
        if (prompts.count(def.id) != 0) {
            throw std::invalid_argument(std::format("duplicate prompt '{}'", def.id));
        }
        std::string id = def.id;
        prompts.emplace(std::move(id), std::make_shared<const PromptDefinition>(std::move(def)));
    }
}

std::shared_ptr<const PromptDefinition> PromptRegistry::Find(const std::string& id) const {
    auto it = prompts.find(id);
    return it == prompts.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const PromptDefinition>> PromptRegistry::List() const {
    std::vector<std::shared_ptr<const PromptDefinition>> out;
    for (const auto& [id, def] : prompts) {
        out.push_back(def);
    }
    return out;
}

PromptOutcome PromptRegistry::Get(const std::string& id, const JSONValue& variables) const {
    FUNC_SCOPE();
    auto def = Find(id);
    if (!def) {
        throw errors::McpException(JSONRPCErrorCodes::PromptNotFound, std::format("Prompt not found: {}", id));
    }
    const bool isNull = std::holds_alternative<std::nullptr_t>(variables.value);
    if (!isNull && !std::holds_alternative<JSONValue::Object>(variables.value)) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "variables must be an object");
    }

    PromptOutcome outcome;
    outcome.id = id;
    std::map<std::string, std::string> resolved;
    for (const auto& var : def->variables) {
        std::optional<std::string> value;
        if (const JSONValue* v = FindMember(variables, var.name)) {
            if (!std::holds_alternative<std::nullptr_t>(v->value)) {
                value = scalarText(*v);
                if (!value.has_value()) {
                    throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                               std::format("variable '{}' must be a {}", var.name, var.type));
                }
            }
        }
        if ((!value.has_value() || value->empty()) && var.defaultValue.has_value()) {
            value = var.defaultValue;
        }
        if (!value.has_value() || value->empty()) {
            if (var.required) {
                outcome.variablesNeeded.push_back(var.name);
            }
            continue;
        }
        resolved[var.name] = std::move(value.value());
    }
    if (!outcome.variablesNeeded.empty()) {
        LOG_DEBUG("Prompt {} needs {} variable(s)", id, outcome.variablesNeeded.size());
        return outcome;
    }
    outcome.text = def->render(resolved);
    return outcome;
}

JSONValue PromptRegistry::Describe(const PromptDefinition& def) {
    JSONValue::Array vars;
    for (const auto& v : def.variables) {
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(v.name);
        o["type"] = std::make_shared<JSONValue>(v.type);
        o["required"] = std::make_shared<JSONValue>(v.required);
        if (!v.description.empty()) {
            o["description"] = std::make_shared<JSONValue>(v.description);
        }
        if (v.defaultValue.has_value()) {
            o["default"] = std::make_shared<JSONValue>(v.defaultValue.value());
        }
        vars.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(def.id);
    obj["title"] = std::make_shared<JSONValue>(def.title);
    obj["description"] = std::make_shared<JSONValue>(def.description);
    obj["variables"] = std::make_shared<JSONValue>(std::move(vars));
    return JSONValue{std::move(obj)};
}

} // namespace toolhost
