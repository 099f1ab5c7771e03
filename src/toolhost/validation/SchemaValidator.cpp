//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: JSON Schema subset evaluation
//==========================================================================================================

#include "toolhost/validation/SchemaValidator.h"

#include <cmath>
#include <format>

namespace toolhost {
namespace validation {

namespace {

const char* typeName(const JSONValue& v) {
    return std::visit([](const auto& x) -> const char* {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, v.value);
}

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "number") {
        return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    }
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            const double d = std::get<double>(v.value);
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return type == typeName(v);
}

void validateNode(const JSONValue& value, const JSONValue& schema, const std::string& path, std::vector<std::string>& errors) {
    if (!std::holds_alternative<JSONValue::Object>(schema.value)) {
        return;
    }

    if (const JSONValue* type = FindMember(schema, "type")) {
        std::vector<std::string> allowed;
        if (std::holds_alternative<std::string>(type->value)) {
            allowed.push_back(std::get<std::string>(type->value));
        } else if (std::holds_alternative<JSONValue::Array>(type->value)) {
            for (const auto& t : std::get<JSONValue::Array>(type->value)) {
                if (t && std::holds_alternative<std::string>(t->value)) {
                    allowed.push_back(std::get<std::string>(t->value));
                }
            }
        }
        if (!allowed.empty()) {
            bool ok = false;
            for (const auto& t : allowed) {
                if (matchesType(value, t)) { ok = true; break; }
            }
            if (!ok) {
                std::string expected;
                for (const auto& t : allowed) {
                    if (!expected.empty()) expected += "|";
                    expected += t;
                }
                errors.push_back(std::format("{}: expected {}, got {}", path, expected, typeName(value)));
                return;
            }
        }
    }

    if (const JSONValue* en = FindMember(schema, "enum")) {
        if (std::holds_alternative<JSONValue::Array>(en->value)) {
            const std::string actual = SerializeJSONValue(value);
            bool found = false;
            for (const auto& candidate : std::get<JSONValue::Array>(en->value)) {
                if (candidate && SerializeJSONValue(*candidate) == actual) { found = true; break; }
            }
            if (!found) {
                errors.push_back(std::format("{}: value {} is not one of the allowed values", path, actual));
            }
        }
    }

    if (std::holds_alternative<JSONValue::Object>(value.value)) {
        const auto& obj = std::get<JSONValue::Object>(value.value);
        const JSONValue* props = FindMember(schema, "properties");

        if (const JSONValue* req = FindMember(schema, "required")) {
            if (std::holds_alternative<JSONValue::Array>(req->value)) {
                for (const auto& r : std::get<JSONValue::Array>(req->value)) {
                    if (!r || !std::holds_alternative<std::string>(r->value)) continue;
                    const auto& name = std::get<std::string>(r->value);
                    if (obj.find(name) == obj.end()) {
                        errors.push_back(std::format("{}: missing required property '{}'", path, name));
                    }
                }
            }
        }

        bool additionalAllowed = true;
        if (const JSONValue* ap = FindMember(schema, "additionalProperties")) {
            if (std::holds_alternative<bool>(ap->value)) {
                additionalAllowed = std::get<bool>(ap->value);
            }
        }

        for (const auto& [key, child] : obj) {
            const JSONValue* childSchema = props ? FindMember(*props, key) : nullptr;
            if (childSchema) {
                validateNode(child ? *child : JSONValue(), *childSchema, path + "." + key, errors);
            } else if (!additionalAllowed) {
                errors.push_back(std::format("{}: unexpected property '{}'", path, key));
            }
        }
    }

    if (std::holds_alternative<JSONValue::Array>(value.value)) {
        if (const JSONValue* items = FindMember(schema, "items")) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                validateNode(arr[i] ? *arr[i] : JSONValue(), *items, std::format("{}[{}]", path, i), errors);
            }
        }
    }
}

} // namespace

std::vector<std::string> validateAgainstSchema(const JSONValue& value, const JSONValue& schema) {
    std::vector<std::string> errors;
    validateNode(value, schema, "$", errors);
    return errors;
}

} // namespace validation
} // namespace toolhost
