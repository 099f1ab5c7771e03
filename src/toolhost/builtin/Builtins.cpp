//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Builtins.cpp
// Purpose: Built-in tool and prompt definitions
//==========================================================================================================

#include "toolhost/builtin/Builtins.h"

#include <format>
#include <future>

#include "logging/Logger.h"

namespace toolhost {
namespace builtin {

namespace {
JSONValue echoSchema() {
    JSONValue::Object message;
    message["type"] = std::make_shared<JSONValue>(std::string("string"));
    message["description"] = std::make_shared<JSONValue>(std::string("Text to echo back"));

    JSONValue::Object props;
    props["message"] = std::make_shared<JSONValue>(std::move(message));

    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(std::string("message")));

    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(std::move(props));
    schema["required"] = std::make_shared<JSONValue>(std::move(required));
    return JSONValue{std::move(schema)};
}
} // namespace

ToolDefinition MakeEchoTool() {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Echo the provided message";
    def.inputSchema = echoSchema();
    def.annotations.readOnly = true;
    def.annotations.idempotent = true;
    def.handler = [](const JSONValue& args, std::stop_token, ProgressReporter) -> std::future<ToolResult> {
        std::string message;
        if (const JSONValue* m = FindMember(args, "message")) {
            if (std::holds_alternative<std::string>(m->value)) {
                message = std::get<std::string>(m->value);
            }
        }
        return std::async(std::launch::async, [message]() {
            LOG_DEBUG("echo: {} byte(s)", message.size());
            ToolResult r = MakeTextResult(message);
            JSONValue::Object structured;
            structured["message"] = std::make_shared<JSONValue>(message);
            r.structuredContent = JSONValue{std::move(structured)};
            return r;
        });
    };
    return def;
}

PromptDefinition MakeScaffoldPagePrompt() {
    PromptDefinition def;
    def.id = "scaffold.page";
    def.title = "Scaffold page";
    def.description = "Instructions for generating a Flutter page with routing and tests";

    PromptVariable name;
    name.name = "name";
    name.required = true;
    name.description = "Page name";

    PromptVariable state;
    state.name = "stateManagement";
    state.defaultValue = "riverpod";
    state.description = "State management solution";

    def.variables = {name, state};
    def.render = [](const std::map<std::string, std::string>& vars) {
        return std::format("Create a Flutter page named \"{}\" using {}. Include a widget, route, and basic tests.",
                           vars.at("name"), vars.at("stateManagement"));
    };
    return def;
}

} // namespace builtin
} // namespace toolhost
