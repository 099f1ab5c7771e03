//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC envelope handling, lifecycle gating and method routing
//==========================================================================================================
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerContext.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

// Receives every outbound message body. Called from the reader thread and from supervisor threads.
using ResponseSink = std::function<void(const std::string& payload)>;

//==========================================================================================================
// Dispatcher
// Purpose: Turns inbound message bodies into responses.
// Notes:
//   - tools/call responses are produced asynchronously when the supervisor resolves the call; all
//     other requests are answered before HandleMessage returns.
//   - tools/*, resources/* and prompts/* fail with NotInitialized until initialize has been handled.
//   - Parse failures answer with id null; notifications never produce a response.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(ServerContext& context, ResponseSink sink);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Handles one complete message body.
    void HandleMessage(const std::string& payload);

    // Reports a framing-level failure (bad header, oversized body) as a ParseError with id null.
    void HandleFramingError(const std::string& detail);

private:
    void handleRequest(const JSONRPCRequest& request);
    void handleNotification(const JSONRPCNotification& notification);

    JSONValue handleInitialize(const JSONRPCRequest& request);
    JSONValue handleListTools();
    void handleCallTool(const JSONRPCRequest& request);
    JSONValue handleListResources(const JSONRPCRequest& request);
    JSONValue handleReadResource(const JSONRPCRequest& request);
    JSONValue handleListPrompts();
    JSONValue handleGetPrompt(const JSONRPCRequest& request);

    void completeCall(const JSONRPCId& id, const std::string& toolName, CallOutcome outcome);

    void sendResult(const JSONRPCId& id, JSONValue result);
    void sendError(const JSONRPCId& id, const errors::McpError& error);

    ServerContext& context;
    ResponseSink sink;
    std::atomic<bool> initialized{false};
};

} // namespace toolhost
