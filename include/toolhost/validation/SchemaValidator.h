//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Minimal JSON Schema checks for tool arguments and shape checks for tool results
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {
namespace validation {

//==========================================================================================================
// validateAgainstSchema
// Purpose: Checks 'value' against the subset of JSON Schema used by tool input schemas.
// Supported keywords:
//   type (object, string, integer, number, boolean, array, null; a string or an array of strings),
//   properties, required, additionalProperties (bool), items, enum (scalars).
//   Unknown keywords are ignored; a non-object schema accepts anything.
// Returns:
//   One message per violation, each prefixed with the JSON path ("$.message: expected string").
//   Empty when valid.
//==========================================================================================================
std::vector<std::string> validateAgainstSchema(const JSONValue& value, const JSONValue& schema);

//------------------------------ Result shape checks ------------------------------
inline bool isContentItem(const JSONValue& v) {
    const JSONValue* type = FindMember(v, "type");
    return type != nullptr && std::holds_alternative<std::string>(type->value);
}

inline bool validateToolResult(const ToolResult& r) {
    for (const auto& item : r.content) {
        if (!isContentItem(item)) return false;
    }
    return true;
}

} // namespace validation
} // namespace toolhost
