//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Method routing, parameter decoding and response construction
//==========================================================================================================

#include "toolhost/Dispatcher.h"

#include <format>
#include <set>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/Protocol.h"
#include "toolhost/execution/ProgressReporter.h"
#include "toolhost/validation/SchemaValidator.h"
#include "toolhost/version.h"

namespace toolhost {

namespace {

[[noreturn]] void throwInvalidParams(const std::string& message) {
    throw errors::McpException(JSONRPCErrorCodes::InvalidParams, message);
}

// Request params as an object; absent params decode as an empty object.
JSONValue paramsObject(const JSONRPCRequest& request) {
    if (!request.params.has_value() || std::holds_alternative<std::nullptr_t>(request.params->value)) {
        return JSONValue{JSONValue::Object{}};
    }
    if (!std::holds_alternative<JSONValue::Object>(request.params->value)) {
        throwInvalidParams(std::format("{}: params must be an object", request.method));
    }
    return request.params.value();
}

std::optional<std::string> optionalString(const JSONValue& params, const char* key) {
    const JSONValue* v = FindMember(params, key);
    if (!v || std::holds_alternative<std::nullptr_t>(v->value)) return std::nullopt;
    if (!std::holds_alternative<std::string>(v->value)) {
        throwInvalidParams(std::format("'{}' must be a string", key));
    }
    return std::get<std::string>(v->value);
}

std::string requiredString(const JSONValue& params, const char* key) {
    auto s = optionalString(params, key);
    if (!s.has_value() || s->empty()) {
        throwInvalidParams(std::format("'{}' is required", key));
    }
    return s.value();
}

std::optional<int64_t> optionalNonNegative(const JSONValue& params, const char* key) {
    const JSONValue* v = FindMember(params, key);
    if (!v || std::holds_alternative<std::nullptr_t>(v->value)) return std::nullopt;
    if (!std::holds_alternative<int64_t>(v->value) || std::get<int64_t>(v->value) < 0) {
        throwInvalidParams(std::format("'{}' must be a non-negative integer", key));
    }
    return std::get<int64_t>(v->value);
}

// Cancellation target: {id} for $/cancelRequest, {requestId} for notifications/cancelled.
std::optional<JSONRPCId> cancelTarget(const JSONRPCNotification& n) {
    if (!n.params.has_value()) return std::nullopt;
    const JSONValue* v = FindMember(n.params.value(), "id");
    if (!v) v = FindMember(n.params.value(), "requestId");
    if (!v) return std::nullopt;
    if (std::holds_alternative<std::string>(v->value)) return JSONRPCId{std::get<std::string>(v->value)};
    if (std::holds_alternative<int64_t>(v->value)) return JSONRPCId{std::get<int64_t>(v->value)};
    return std::nullopt;
}

// params._meta.progressToken; a string or an integer.
std::optional<JSONValue> progressToken(const JSONValue& params) {
    const JSONValue* meta = FindMember(params, "_meta");
    if (!meta) return std::nullopt;
    const JSONValue* token = FindMember(*meta, "progressToken");
    if (!token) return std::nullopt;
    if (std::holds_alternative<std::string>(token->value) || std::holds_alternative<int64_t>(token->value)) {
        return *token;
    }
    LOG_WARN("Dispatcher: ignoring progressToken that is neither a string nor an integer");
    return std::nullopt;
}

const std::set<std::string>& gatedMethods() {
    static const std::set<std::string> methods = {
        Methods::ListTools, Methods::CallTool,
        Methods::ListResources, Methods::ReadResource,
        Methods::ListPrompts, Methods::GetPrompt,
    };
    return methods;
}

} // namespace

Dispatcher::Dispatcher(ServerContext& ctx, ResponseSink responseSink)
    : context(ctx), sink(std::move(responseSink)) {
    if (!sink) {
        throw std::invalid_argument("Dispatcher requires a response sink");
    }
}

void Dispatcher::HandleMessage(const std::string& payload) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(payload);
    } catch (const std::exception& e) {
        LOG_WARN("Dispatcher: unparseable message ({} bytes): {}", payload.size(), e.what());
        JSONValue::Object data;
        data["detail"] = std::make_shared<JSONValue>(std::string(e.what()));
        sendError(nullptr, errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue{std::move(data)}));
        return;
    }

    if (!std::holds_alternative<JSONValue::Object>(doc.value)) {
        sendError(nullptr, errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: message must be an object"));
        return;
    }

    // Best-effort id recovery so InvalidRequest can still be correlated
    JSONRPCId recoveredId = nullptr;
    const JSONValue* idVal = FindMember(doc, "id");
    if (idVal) {
        if (std::holds_alternative<std::string>(idVal->value)) recoveredId = std::get<std::string>(idVal->value);
        else if (std::holds_alternative<int64_t>(idVal->value)) recoveredId = std::get<int64_t>(idVal->value);
    }

    if (!FindMember(doc, "method")) {
        if (idVal && (FindMember(doc, "result") || FindMember(doc, "error"))) {
            LOG_DEBUG("Dispatcher: ignoring response from client for id {}", IdToString(recoveredId));
            return;
        }
        sendError(recoveredId, errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method"));
        return;
    }

    if (!idVal) {
        JSONRPCNotification notification;
        if (!notification.FromValue(doc)) {
            LOG_WARN("Dispatcher: dropping malformed notification");
            return;
        }
        handleNotification(notification);
        return;
    }

    JSONRPCRequest request;
    if (!request.FromValue(doc)) {
        sendError(recoveredId, errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
        return;
    }
    handleRequest(request);
}

void Dispatcher::HandleFramingError(const std::string& detail) {
    LOG_WARN("Dispatcher: framing error: {}", detail);
    JSONValue::Object data;
    data["detail"] = std::make_shared<JSONValue>(detail);
    sendError(nullptr, errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue{std::move(data)}));
}

void Dispatcher::handleRequest(const JSONRPCRequest& request) {
    LOG_DEBUG("Dispatcher: request {} id={}", request.method, IdToString(request.id));
    try {
        const std::string& m = request.method;
        if (m == Methods::Initialize) {
            sendResult(request.id, handleInitialize(request));
            return;
        }
        if (m == Methods::Ping) {
            sendResult(request.id, JSONValue{JSONValue::Object{}});
            return;
        }
        if (gatedMethods().count(m) == 0) {
            sendError(request.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                    std::format("Method not found: {}", m)));
            return;
        }
        if (!initialized.load()) {
            sendError(request.id, errors::makeError(JSONRPCErrorCodes::NotInitialized,
                                                    std::format("Server not initialized: {} requires initialize first", m)));
            return;
        }

        if (m == Methods::ListTools) {
            sendResult(request.id, handleListTools());
        } else if (m == Methods::CallTool) {
            handleCallTool(request);
        } else if (m == Methods::ListResources) {
            sendResult(request.id, handleListResources(request));
        } else if (m == Methods::ReadResource) {
            sendResult(request.id, handleReadResource(request));
        } else if (m == Methods::ListPrompts) {
            sendResult(request.id, handleListPrompts());
        } else if (m == Methods::GetPrompt) {
            sendResult(request.id, handleGetPrompt(request));
        }
    } catch (const errors::McpException& e) {
        sendError(request.id, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher: {} failed: {}", request.method, e.what());
        sendError(request.id, errors::makeError(JSONRPCErrorCodes::InternalError,
                                                std::format("Internal error: {}", e.what())));
    }
}

void Dispatcher::handleNotification(const JSONRPCNotification& notification) {
    const std::string& m = notification.method;
    if (m == Methods::CancelRequest || m == Methods::Cancelled) {
        auto target = cancelTarget(notification);
        if (!target.has_value()) {
            LOG_WARN("Dispatcher: {} without a usable id", m);
            return;
        }
        if (!context.Supervisor().Cancel(target.value())) {
            LOG_DEBUG("Dispatcher: cancellation for {} ignored (not in flight)", IdToString(target.value()));
        }
        return;
    }
    if (m == Methods::Initialized) {
        LOG_DEBUG("Dispatcher: client reported initialized");
        return;
    }
    LOG_DEBUG("Dispatcher: dropping unknown notification {}", m);
}

///////////////////////////////////////// Lifecycle ///////////////////////////////////////////
JSONValue Dispatcher::handleInitialize(const JSONRPCRequest& request) {
    std::string clientName = "unknown";
    std::string clientVersion;
    if (request.params.has_value()) {
        if (const JSONValue* info = FindMember(request.params.value(), "clientInfo")) {
            if (const JSONValue* n = FindMember(*info, "name"); n && std::holds_alternative<std::string>(n->value)) {
                clientName = std::get<std::string>(n->value);
            }
            if (const JSONValue* v = FindMember(*info, "version"); v && std::holds_alternative<std::string>(v->value)) {
                clientVersion = std::get<std::string>(v->value);
            }
        }
    }
    if (initialized.exchange(true)) {
        LOG_WARN("Dispatcher: repeated initialize from {}", clientName);
    } else {
        LOG_INFO("Dispatcher: initialized by {} {}", clientName, clientVersion);
    }

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(SERVER_NAME);
    serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());

    JSONValue::Object caps;
    caps["tools"] = std::make_shared<JSONValue>(!context.Tools().Empty());
    caps["prompts"] = std::make_shared<JSONValue>(!context.Prompts().Empty());
    if (context.Resources().Empty()) {
        caps["resources"] = std::make_shared<JSONValue>(nullptr);
    } else {
        JSONValue::Array prefixes;
        for (const auto& p : context.Resources().Prefixes()) {
            prefixes.push_back(std::make_shared<JSONValue>(p));
        }
        JSONValue::Object res;
        res["prefixes"] = std::make_shared<JSONValue>(std::move(prefixes));
        caps["resources"] = std::make_shared<JSONValue>(std::move(res));
    }

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
    result["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
    return JSONValue{std::move(result)};
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
JSONValue Dispatcher::handleListTools() {
    JSONValue::Array tools;
    for (const auto& def : context.Tools().List()) {
        tools.push_back(std::make_shared<JSONValue>(ToolRegistry::Describe(*def)));
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return JSONValue{std::move(result)};
}

void Dispatcher::handleCallTool(const JSONRPCRequest& request) {
    const JSONValue params = paramsObject(request);
    const std::string name = requiredString(params, "name");

    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = FindMember(params, "arguments"); a && !std::holds_alternative<std::nullptr_t>(a->value)) {
        if (!std::holds_alternative<JSONValue::Object>(a->value)) {
            throwInvalidParams("'arguments' must be an object");
        }
        arguments = *a;
    }

    auto tool = context.Tools().Find(name);
    if (!tool) {
        JSONValue::Object data;
        data["name"] = std::make_shared<JSONValue>(name);
        throw errors::McpException(JSONRPCErrorCodes::ToolNotFound, std::format("Tool not found: {}", name),
                                   JSONValue{std::move(data)});
    }

    const std::size_t argBytes = SerializeJSONValue(arguments).size();
    const std::size_t argLimit = context.Config().sizeLimits.maxParameterBytes;
    if (argBytes > argLimit) {
        throwInvalidParams(std::format("Arguments for '{}' are {} bytes, limit is {}", name, argBytes, argLimit));
    }

    auto problems = validation::validateAgainstSchema(arguments, tool->inputSchema);
    if (!problems.empty()) {
        JSONValue::Array list;
        for (const auto& p : problems) {
            list.push_back(std::make_shared<JSONValue>(p));
        }
        JSONValue::Object data;
        data["errors"] = std::make_shared<JSONValue>(std::move(list));
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::format("Invalid arguments for '{}': {}", name, problems.front()),
                                   JSONValue{std::move(data)});
    }

    if (tool->annotations.requiresConfirmation) {
        const JSONValue* confirm = FindMember(arguments, "confirm");
        const bool confirmed = confirm && std::holds_alternative<bool>(confirm->value) && std::get<bool>(confirm->value);
        if (!confirmed) {
            throw errors::McpException(JSONRPCErrorCodes::SandboxViolation,
                                       std::format("Permission denied: tool '{}' requires confirm=true", name));
        }
    }

    ProgressReporter progress;
    if (auto token = progressToken(params)) {
        progress = ProgressReporter(std::move(token.value()), [this](const std::string& payload) { sink(payload); });
    }

    const JSONRPCId id = request.id;
    auto rejection = context.Supervisor().Submit(id, tool, std::move(arguments),
        [this, id, name](CallOutcome outcome) { completeCall(id, name, std::move(outcome)); },
        std::move(progress));
    if (rejection.has_value()) {
        sendError(id, rejection.value());
    }
}

void Dispatcher::completeCall(const JSONRPCId& id, const std::string& toolName, CallOutcome outcome) {
    if (outcome.error.has_value()) {
        sendError(id, outcome.error.value());
        return;
    }
    const ToolResult& result = outcome.result.value();
    if (!validation::validateToolResult(result)) {
        sendError(id, errors::makeError(JSONRPCErrorCodes::InternalError,
                                        std::format("Tool '{}' returned malformed content", toolName)));
        return;
    }
    JSONValue value = ToolResultToJSON(result);
    const std::size_t bytes = SerializeJSONValue(value).size();
    const std::size_t limit = context.Config().sizeLimits.maxResultBytes;
    if (bytes > limit) {
        JSONValue::Object data;
        data["size"] = std::make_shared<JSONValue>(static_cast<int64_t>(bytes));
        data["limit"] = std::make_shared<JSONValue>(static_cast<int64_t>(limit));
        sendError(id, errors::makeError(JSONRPCErrorCodes::InternalError,
                                        std::format("Result of '{}' exceeds the result size limit", toolName),
                                        JSONValue{std::move(data)}));
        return;
    }
    LOG_DEBUG("Dispatcher: call {} ({}) completed in {}ms", IdToString(id), toolName, outcome.elapsed.count());
    sendResult(id, std::move(value));
}

///////////////////////////////////////// Resources ///////////////////////////////////////////
JSONValue Dispatcher::handleListResources(const JSONRPCRequest& request) {
    const JSONValue params = paramsObject(request);

    ListResourcesParams p;
    p.directory = optionalString(params, "directory");
    p.prefix = optionalString(params, "prefix");
    p.page = optionalNonNegative(params, "page").value_or(0);
    if (const JSONValue* ps = FindMember(params, "pageSize"); ps && !std::holds_alternative<std::nullptr_t>(ps->value)) {
        if (!std::holds_alternative<int64_t>(ps->value) ||
            std::get<int64_t>(ps->value) < 1 || std::get<int64_t>(ps->value) > MAX_PAGE_SIZE) {
            throwInvalidParams(std::format("'pageSize' must be an integer in [1, {}]", MAX_PAGE_SIZE));
        }
        p.pageSize = std::get<int64_t>(ps->value);
    }

    const std::string uri = optionalString(params, "uri").value_or("workspace://");
    auto strategy = context.Resources().Find(uri);
    if (!strategy) {
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound, std::format("No resource provider for {}", uri));
    }
    // A uri below the prefix narrows the listing
    const std::string rest = uri.substr(strategy->UriPrefix().size());
    if (!rest.empty()) {
        if (!p.directory.has_value()) p.directory = rest;
        if (!p.prefix.has_value()) p.prefix = rest;
    }
    return ResourcePageToJSON(strategy->List(p));
}

JSONValue Dispatcher::handleReadResource(const JSONRPCRequest& request) {
    const JSONValue params = paramsObject(request);
    ReadResourceParams p;
    p.uri = requiredString(params, "uri");
    p.start = optionalNonNegative(params, "start");
    p.length = optionalNonNegative(params, "length");

    auto strategy = context.Resources().Find(p.uri);
    if (!strategy) {
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound, std::format("Resource not found: {}", p.uri));
    }
    return ResourceContentToJSON(strategy->Read(p));
}

///////////////////////////////////////// Prompts ///////////////////////////////////////////
JSONValue Dispatcher::handleListPrompts() {
    JSONValue::Array prompts;
    for (const auto& def : context.Prompts().List()) {
        prompts.push_back(std::make_shared<JSONValue>(PromptRegistry::Describe(*def)));
    }
    JSONValue::Object result;
    result["prompts"] = std::make_shared<JSONValue>(std::move(prompts));
    return JSONValue{std::move(result)};
}

JSONValue Dispatcher::handleGetPrompt(const JSONRPCRequest& request) {
    const JSONValue params = paramsObject(request);
    auto id = optionalString(params, "id");
    if (!id.has_value()) {
        id = optionalString(params, "name");
    }
    if (!id.has_value() || id->empty()) {
        throwInvalidParams("'id' is required");
    }
    JSONValue variables{JSONValue::Object{}};
    if (const JSONValue* v = FindMember(params, "variables")) {
        variables = *v;
    } else if (const JSONValue* a = FindMember(params, "arguments")) {
        variables = *a;
    }
    return context.Prompts().Get(id.value(), variables).ToJSON();
}

///////////////////////////////////////// Output ///////////////////////////////////////////
void Dispatcher::sendResult(const JSONRPCId& id, JSONValue result) {
    JSONRPCResponse response(id, std::move(result));
    sink(response.Serialize());
}

void Dispatcher::sendError(const JSONRPCId& id, const errors::McpError& error) {
    LOG_WARN("Dispatcher: error response id={} code={} ({}): {}", IdToString(id), error.code,
             errors::categoryName(error.category), error.message);
    sink(errors::makeErrorResponse(id, error)->Serialize());
}

} // namespace toolhost
