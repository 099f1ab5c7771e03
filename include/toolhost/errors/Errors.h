//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, the exception that carries them, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Categorization of the error codes the server emits.
enum class ErrorCategory {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    InternalError,
    InvalidRequestId,
    NotInitialized,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    SandboxViolation,
    Timeout,
    Cancelled,
    ServerBusy,
    Unknown
};

// Typed error representation used across the server.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or toolhost-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::ParseError;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::InvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::InternalError;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::InvalidRequestId;
        case JSONRPCErrorCodes::NotInitialized: return ErrorCategory::NotInitialized;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::SandboxViolation: return ErrorCategory::SandboxViolation;
        case JSONRPCErrorCodes::Timeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::Cancelled: return ErrorCategory::Cancelled;
        case JSONRPCErrorCodes::ServerBusy: return ErrorCategory::ServerBusy;
        default: return ErrorCategory::Unknown;
    }
}

// Stable name of a category, reported as error.data.category.
inline const char* categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::ParseError: return "ParseError";
        case ErrorCategory::InvalidRequest: return "InvalidRequest";
        case ErrorCategory::MethodNotFound: return "MethodNotFound";
        case ErrorCategory::InvalidParams: return "InvalidParams";
        case ErrorCategory::InternalError: return "InternalError";
        case ErrorCategory::InvalidRequestId: return "InvalidRequestId";
        case ErrorCategory::NotInitialized: return "NotInitialized";
        case ErrorCategory::ToolNotFound: return "ToolNotFound";
        case ErrorCategory::ResourceNotFound: return "ResourceNotFound";
        case ErrorCategory::PromptNotFound: return "PromptNotFound";
        case ErrorCategory::SandboxViolation: return "SandboxViolation";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::Cancelled: return "Cancelled";
        case ErrorCategory::ServerBusy: return "ServerBusy";
        default: return "Unknown";
    }
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// McpException
// Purpose: Carries an McpError out of strategy and registry code. The dispatcher converts it into an
//          error response correlated with the request id.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), error_(makeError(code, message, std::move(data))) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = FindMember(errVal, "code");
    const JSONValue* msg = FindMember(errVal, "message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) ||
        !std::holds_alternative<std::string>(msg->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(code->value)), std::get<std::string>(msg->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError. The category name is merged into data when
// data is absent or an object.
//
// Args:
//   err: The McpError to serialize.
//
// Returns:
//   JSONValue of Object type with code/message and data.
inline JSONValue makeErrorValue(const McpError& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(err.code));
    obj["message"] = std::make_shared<JSONValue>(err.message);
    JSONValue data{JSONValue::Object{}};
    if (err.data.has_value()) {
        data = err.data.value();
    }
    if (std::holds_alternative<JSONValue::Object>(data.value)) {
        auto& d = std::get<JSONValue::Object>(data.value);
        if (d.find("category") == d.end()) {
            d["category"] = std::make_shared<JSONValue>(categoryName(err.category));
        }
    }
    obj["data"] = std::make_shared<JSONValue>(std::move(data));
    return JSONValue{std::move(obj)};
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = makeErrorValue(err);
    return response;
}

} // namespace errors
} // namespace toolhost
