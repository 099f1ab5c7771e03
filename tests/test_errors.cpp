//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"
#include <iterator>

using namespace toolhost;

TEST(Errors, CategoryMapping) {
    using toolhost::errors::ErrorCategory;
    using toolhost::errors::errorCategoryFromCode;
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::ParseError);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::InvalidRequest);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::MethodNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::InvalidParams);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::InternalError);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequestId), ErrorCategory::InvalidRequestId);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::NotInitialized), ErrorCategory::NotInitialized);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::ResourceNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::ToolNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::PromptNotFound), ErrorCategory::PromptNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::SandboxViolation), ErrorCategory::SandboxViolation);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::Timeout), ErrorCategory::Timeout);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::Cancelled), ErrorCategory::Cancelled);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ServerBusy), ErrorCategory::ServerBusy);
    EXPECT_EQ(errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, CodesAreDistinct) {
    const int codes[] = {
        JSONRPCErrorCodes::InvalidRequestId, JSONRPCErrorCodes::ResourceNotFound, JSONRPCErrorCodes::ToolNotFound,
        JSONRPCErrorCodes::PromptNotFound, JSONRPCErrorCodes::NotInitialized, JSONRPCErrorCodes::Cancelled,
        JSONRPCErrorCodes::Timeout, JSONRPCErrorCodes::ServerBusy, JSONRPCErrorCodes::SandboxViolation};
    for (std::size_t i = 0; i < std::size(codes); ++i) {
        for (std::size_t j = i + 1; j < std::size(codes); ++j) {
            EXPECT_NE(codes[i], codes[j]);
        }
    }
}

TEST(Errors, ErrorValueAddsCategoryToData) {
    auto err = errors::makeError(JSONRPCErrorCodes::Timeout, "Tool 'slow' timed out after 50ms");
    JSONValue v = errors::makeErrorValue(err);
    ASSERT_NE(FindMember(v, "data"), nullptr);
    const JSONValue* cat = FindMember(*FindMember(v, "data"), "category");
    ASSERT_NE(cat, nullptr);
    EXPECT_EQ(std::get<std::string>(cat->value), "Timeout");
    EXPECT_EQ(std::get<int64_t>(FindMember(v, "code")->value), JSONRPCErrorCodes::Timeout);
}

TEST(Errors, ErrorValueKeepsCallerData) {
    JSONValue::Object d;
    d["name"] = std::make_shared<JSONValue>(std::string("nope"));
    d["category"] = std::make_shared<JSONValue>(std::string("Custom"));
    auto err = errors::makeError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: nope", JSONValue{d});
    JSONValue v = errors::makeErrorValue(err);
    const JSONValue* data = FindMember(v, "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::get<std::string>(FindMember(*data, "name")->value), "nope");
    EXPECT_EQ(std::get<std::string>(FindMember(*data, "category")->value), "Custom");
}

TEST(Errors, RoundTripThroughResponse) {
    auto err = errors::makeError(JSONRPCErrorCodes::ServerBusy, "Server busy");
    auto resp = errors::makeErrorResponse(JSONRPCId{int64_t{4}}, err);
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(resp->Serialize()));
    auto back = errors::mcpErrorFromResponse(parsed);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, JSONRPCErrorCodes::ServerBusy);
    EXPECT_EQ(back->category, errors::ErrorCategory::ServerBusy);
    EXPECT_EQ(back->message, "Server busy");
}

TEST(Errors, MalformedErrorObjectIsRejected) {
    JSONValue::Object o;
    o["code"] = std::make_shared<JSONValue>(std::string("x"));
    o["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{o}).has_value());
}

TEST(Errors, ExceptionCarriesError) {
    try {
        throw errors::McpException(JSONRPCErrorCodes::PromptNotFound, "Prompt not found: x");
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::PromptNotFound);
        EXPECT_EQ(e.error().category, errors::ErrorCategory::PromptNotFound);
        EXPECT_STREQ(e.what(), "Prompt not found: x");
    }
}
