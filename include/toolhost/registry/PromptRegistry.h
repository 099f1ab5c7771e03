//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.h
// Purpose: Prompt definitions, variable handling and the immutable id -> prompt table
//==========================================================================================================
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

struct PromptVariable {
    std::string name;
    std::string type = "string";
    bool required = false;
    std::optional<std::string> defaultValue;
    std::string description;
};

// Receives every declared variable that has a value (supplied or default).
using PromptRenderer = std::function<std::string(const std::map<std::string, std::string>& variables)>;

struct PromptDefinition {
    std::string id;
    std::string title;
    std::string description;
    std::vector<PromptVariable> variables;
    PromptRenderer render;
};

//==========================================================================================================
// PromptOutcome
// Purpose: Either rendered text, or the exact list of missing required variables (a normal result).
//==========================================================================================================
struct PromptOutcome {
    std::string id;
    std::optional<std::string> text;
    std::vector<std::string> variablesNeeded;

    JSONValue ToJSON() const;
};

class PromptRegistry {
public:
    // Throws std::invalid_argument on empty or duplicate ids, or missing renderers.
    explicit PromptRegistry(std::vector<PromptDefinition> prompts);

    std::shared_ptr<const PromptDefinition> Find(const std::string& id) const;
    std::vector<std::shared_ptr<const PromptDefinition>> List() const;
    bool Empty() const { return prompts.empty(); }

    //==========================================================================================================
    // Get
    // Purpose: Render prompt 'id' with 'variables' (object of name -> string/number/bool).
    // Notes:
    //   A required variable that is absent, null or an empty string is reported in variablesNeeded.
    //   Declared defaults are applied before the check.
    // Throws:
    //   errors::McpException PromptNotFound for unknown ids; InvalidParams when 'variables' is not an
    //   object or a value is not a scalar.
    //==========================================================================================================
    PromptOutcome Get(const std::string& id, const JSONValue& variables) const;

    // {id, title, description, variables:[{name,type,required,default?}]} entry for prompts/list.
    static JSONValue Describe(const PromptDefinition& def);

private:
    std::map<std::string, std::shared_ptr<const PromptDefinition>> prompts;
};

} // namespace toolhost
