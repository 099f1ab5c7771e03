//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversions for protocol result structures
//==========================================================================================================

#include "toolhost/Protocol.h"

namespace toolhost {

ToolResult MakeTextResult(const std::string& text, bool isError) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>(std::string("text"));
    item["text"] = std::make_shared<JSONValue>(text);
    ToolResult r;
    r.content.push_back(JSONValue{std::move(item)});
    r.isError = isError;
    return r;
}

JSONValue ToolResultToJSON(const ToolResult& result) {
    JSONValue::Array content;
    for (const auto& c : result.content) {
        content.push_back(std::make_shared<JSONValue>(c));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    if (result.structuredContent.has_value()) {
        obj["structuredContent"] = std::make_shared<JSONValue>(result.structuredContent.value());
    }
    return JSONValue{std::move(obj)};
}

JSONValue ResourcePageToJSON(const ResourcePage& page) {
    JSONValue::Array items;
    for (const auto& e : page.items) {
        JSONValue::Object item;
        item["uri"] = std::make_shared<JSONValue>(e.uri);
        item["name"] = std::make_shared<JSONValue>(e.name);
        item["size"] = std::make_shared<JSONValue>(e.size);
        if (e.mimeType.has_value()) {
            item["mimeType"] = std::make_shared<JSONValue>(e.mimeType.value());
        }
        if (e.entries.has_value()) {
            item["entries"] = std::make_shared<JSONValue>(e.entries.value());
        }
        items.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    JSONValue::Object obj;
    obj["items"] = std::make_shared<JSONValue>(std::move(items));
    obj["total"] = std::make_shared<JSONValue>(page.total);
    obj["page"] = std::make_shared<JSONValue>(page.page);
    obj["pageSize"] = std::make_shared<JSONValue>(page.pageSize);
    return JSONValue{std::move(obj)};
}

JSONValue ResourceContentToJSON(const ResourceContent& content) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(content.uri);
    obj["mimeType"] = std::make_shared<JSONValue>(content.mimeType);
    obj["content"] = std::make_shared<JSONValue>(content.content);
    obj["encoding"] = std::make_shared<JSONValue>(content.encoding);
    obj["total"] = std::make_shared<JSONValue>(content.total);
    obj["start"] = std::make_shared<JSONValue>(content.start);
    obj["length"] = std::make_shared<JSONValue>(content.length);
    return JSONValue{std::move(obj)};
}

} // namespace toolhost
