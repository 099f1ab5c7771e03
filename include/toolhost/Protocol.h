//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, limits and method names served by toolhost
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace toolhost {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "toolhost";

// Resource listing page bounds
constexpr int64_t DEFAULT_PAGE_SIZE = 100;
constexpr int64_t MAX_PAGE_SIZE = 1000;

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Result of a tool handler. 'content' holds content items ({type:"text", text:...}).
struct ToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
    std::optional<JSONValue> structuredContent;
};

// Single text content item result
ToolResult MakeTextResult(const std::string& text, bool isError = false);
JSONValue ToolResultToJSON(const ToolResult& result);

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ListResourcesParams {
    std::optional<std::string> directory;   // strategy-relative sub-tree (workspace)
    std::optional<std::string> prefix;      // id prefix filter (logs)
    int64_t page = 0;
    int64_t pageSize = DEFAULT_PAGE_SIZE;
};

struct ResourceEntry {
    std::string uri;
    std::string name;
    int64_t size = 0;
    std::optional<std::string> mimeType;
    std::optional<int64_t> entries;  // entry count for log resources
};

struct ResourcePage {
    std::vector<ResourceEntry> items;
    int64_t total = 0;
    int64_t page = 0;
    int64_t pageSize = DEFAULT_PAGE_SIZE;
};

struct ReadResourceParams {
    std::string uri;
    std::optional<int64_t> start;   // byte offset, default 0
    std::optional<int64_t> length;  // byte count, default to end
};

struct ResourceContent {
    std::string uri;
    std::string mimeType;
    std::string content;
    std::string encoding = "utf-8";
    int64_t total = 0;   // full size in bytes
    int64_t start = 0;   // effective offset after clamping
    int64_t length = 0;  // bytes actually returned
};

JSONValue ResourcePageToJSON(const ResourcePage& page);
JSONValue ResourceContentToJSON(const ResourceContent& content);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";

    // Client to server
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* CancelRequest = "$/cancelRequest";
    constexpr const char* Cancelled = "notifications/cancelled";

    // Server to client
    constexpr const char* Progress = "notifications/progress";
}

} // namespace toolhost
