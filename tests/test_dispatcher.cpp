//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher.cpp
// Purpose: End-to-end request handling through Server + InMemoryTransport
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <random>
#include <string>
#include <thread>

#include "TestClient.h"
#include "toolhost/Server.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace toolhost::testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

JSONValue S(const std::string& s) { return JSONValue(s); }
JSONValue I(int64_t v) { return JSONValue(v); }
JSONRPCId id(int64_t v) { return JSONRPCId{v}; }

std::string textAt(const JSONValue& v, const char* key) {
    const JSONValue* m = FindMember(v, key);
    return (m && std::holds_alternative<std::string>(m->value)) ? std::get<std::string>(m->value) : std::string();
}

// Whole numbers serialize without a fraction and parse back as integers.
double numberAt(const JSONValue& v, const char* key) {
    const JSONValue* m = FindMember(v, key);
    if (m && std::holds_alternative<int64_t>(m->value)) return static_cast<double>(std::get<int64_t>(m->value));
    return (m && std::holds_alternative<double>(m->value)) ? std::get<double>(m->value) : -1.0;
}

const JSONValue::Array& arrayAt(const JSONValue& v, const char* key) {
    static const JSONValue::Array empty;
    const JSONValue* m = FindMember(v, key);
    return (m && std::holds_alternative<JSONValue::Array>(m->value)) ? std::get<JSONValue::Array>(m->value) : empty;
}

JSONValue permissiveSchema() {
    JSONValue::Object o;
    o["type"] = std::make_shared<JSONValue>(std::string("object"));
    return JSONValue{std::move(o)};
}

// Runs until its stop token is signalled.
ToolDefinition blockingTool() {
    ToolDefinition def;
    def.name = "block";
    def.description = "Waits for cancellation";
    def.inputSchema = permissiveSchema();
    def.handler = [](const JSONValue&, std::stop_token st, ProgressReporter) {
        return std::async(std::launch::async, [st]() {
            while (!st.stop_requested()) {
                std::this_thread::sleep_for(5ms);
            }
            return MakeTextResult("stopped");
        });
    };
    return def;
}

ToolDefinition confirmTool() {
    ToolDefinition def;
    def.name = "wipe";
    def.description = "Requires confirmation";
    def.inputSchema = permissiveSchema();
    def.annotations.requiresConfirmation = true;
    def.handler = [](const JSONValue&, std::stop_token, ProgressReporter) {
        std::promise<ToolResult> p;
        p.set_value(MakeTextResult("wiped"));
        return p.get_future();
    };
    return def;
}

// Reports three steps, then answers.
ToolDefinition stepsTool() {
    ToolDefinition def;
    def.name = "steps";
    def.description = "Reports progress";
    def.inputSchema = permissiveSchema();
    def.handler = [](const JSONValue&, std::stop_token, ProgressReporter progress) {
        progress.Report(1, 3.0, "scanning");
        progress.Report(1, 3.0, "repeated");
        progress.Report(2, 3.0);
        progress.Report(3, 3.0, "done");
        std::promise<ToolResult> p;
        p.set_value(MakeTextResult(progress.Enabled() ? "reported" : "silent"));
        return p.get_future();
    };
    return def;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        base = fs::temp_directory_path() / ("toolhost-e2e-" + std::to_string(rd()));
        root = base / "project";
        fs::create_directories(root / "lib");
        std::ofstream(root / "a.txt", std::ios::binary) << "hello world";
        std::ofstream(root / "lib" / "b.dart", std::ios::binary) << "x";
        std::ofstream(base / "outside.txt", std::ios::binary) << "secret";
        cfg.sandboxRoot = root;
    }

    void TearDown() override {
        server.reset();
        client.reset();
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    void start(std::vector<ToolDefinition> extra = {}) {
        context = MakeDefaultServerContext(cfg, std::move(extra));
        auto pair = InMemoryTransport::CreatePair();
        server = std::make_unique<Server>(context);
        server->Start(std::move(pair.second)).get();
        client = std::make_unique<TestClient>(std::move(pair.first));
        client->Start();
    }

    void initialize() {
        auto r = client->Call(id(0), "initialize", Obj({{"clientInfo", Obj({{"name", S("tests")}})}}));
        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->result.has_value());
    }

    std::optional<JSONRPCResponse> callTool(int64_t n, const std::string& name, JSONValue arguments) {
        return client->Call(id(n), "tools/call", Obj({{"name", S(name)}, {"arguments", std::move(arguments)}}));
    }

    fs::path base;
    fs::path root;
    config::ServerConfig cfg;
    std::shared_ptr<ServerContext> context;
    std::unique_ptr<Server> server;
    std::unique_ptr<TestClient> client;
};

} // namespace

TEST_F(DispatcherTest, RequestsBeforeInitializeAreRejected) {
    start();
    auto r = client->Call(id(1), "tools/list");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::NotInitialized);

    // ping and initialize are always served
    auto pong = client->Call(id(2), "ping");
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ(ErrorCode(*pong), 0);
}

TEST_F(DispatcherTest, InitializeReportsCapabilities) {
    start();
    auto r = client->Call(id(1), "initialize", Obj({{"clientInfo", Obj({{"name", S("tests")}, {"version", S("1")}})}}));
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->result.has_value());
    const JSONValue& result = r->result.value();
    EXPECT_EQ(textAt(result, "protocolVersion"), "2024-11-05");
    const JSONValue* info = FindMember(result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(textAt(*info, "name"), "toolhost");

    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    const JSONValue* tools = FindMember(*caps, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_TRUE(std::get<bool>(tools->value));
    const JSONValue* resources = FindMember(*caps, "resources");
    ASSERT_NE(resources, nullptr);
    const auto& prefixes = arrayAt(*resources, "prefixes");
    ASSERT_EQ(prefixes.size(), 2u);
    EXPECT_EQ(std::get<std::string>(prefixes[0]->value), "logs://");
    EXPECT_EQ(std::get<std::string>(prefixes[1]->value), "workspace://");
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    start();
    initialize();
    auto r = client->Call(id(1), "tools/unknown");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(DispatcherTest, ListToolsIncludesExtras) {
    start({confirmTool()});
    initialize();
    auto r = client->Call(id(1), "tools/list");
    ASSERT_TRUE(r.has_value() && r->result.has_value());
    const auto& tools = arrayAt(r->result.value(), "tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(textAt(*tools[0], "name"), "echo");
    EXPECT_EQ(textAt(*tools[1], "name"), "wipe");
}

TEST_F(DispatcherTest, EchoReturnsTextAndStructuredContent) {
    start();
    initialize();
    auto r = callTool(1, "echo", Obj({{"message", S("hello")}}));
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->result.has_value()) << r->Serialize();
    const auto& content = arrayAt(r->result.value(), "content");
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(textAt(*content[0], "type"), "text");
    EXPECT_EQ(textAt(*content[0], "text"), "hello");
    const JSONValue* structured = FindMember(r->result.value(), "structuredContent");
    ASSERT_NE(structured, nullptr);
    EXPECT_EQ(textAt(*structured, "message"), "hello");
    const JSONValue* isError = FindMember(r->result.value(), "isError");
    ASSERT_NE(isError, nullptr);
    EXPECT_FALSE(std::get<bool>(isError->value));
}

TEST_F(DispatcherTest, UnknownToolTakesNoSlot) {
    start();
    initialize();
    auto r = callTool(1, "nope", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::ToolNotFound);
    auto stats = context->Supervisor().GetStats();
    EXPECT_EQ(stats.running, 0u);
    EXPECT_EQ(stats.inFlight, 0u);
}

TEST_F(DispatcherTest, SchemaViolationListsProblems) {
    start();
    initialize();
    auto r = callTool(1, "echo", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(ErrorCode(*r), JSONRPCErrorCodes::InvalidParams);
    const JSONValue* data = FindMember(r->error.value(), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_FALSE(arrayAt(*data, "errors").empty());
    EXPECT_EQ(textAt(*data, "category"), "InvalidParams");
}

TEST_F(DispatcherTest, ConfirmationIsRequired) {
    start({confirmTool()});
    initialize();
    auto denied = callTool(1, "wipe", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(denied.has_value());
    EXPECT_EQ(ErrorCode(*denied), JSONRPCErrorCodes::SandboxViolation);

    auto allowed = callTool(2, "wipe", Obj({{"confirm", JSONValue(true)}}));
    ASSERT_TRUE(allowed.has_value());
    EXPECT_EQ(ErrorCode(*allowed), 0);
}

TEST_F(DispatcherTest, OversizedArgumentsAreRejected) {
    cfg.sizeLimits.maxParameterBytes = 64;
    start();
    initialize();
    auto r = callTool(1, "echo", Obj({{"message", S(std::string(100, 'm'))}}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatcherTest, OversizedResultIsInternalError) {
    cfg.sizeLimits.maxResultBytes = 256;
    start();
    initialize();
    auto r = callTool(1, "echo", Obj({{"message", S(std::string(1000, 'r'))}}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::InternalError);
}

TEST_F(DispatcherTest, CancelNotificationStopsCall) {
    start({blockingTool()});
    initialize();
    client->Send(id(5), "tools/call", Obj({{"name", S("block")}, {"arguments", JSONValue{JSONValue::Object{}}}}));
    client->Notify("$/cancelRequest", Obj({{"id", I(5)}}));
    auto r = client->Wait(id(5));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::Cancelled);

    // The slot is free again
    auto echo = callTool(6, "echo", Obj({{"message", S("after")}}));
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(ErrorCode(*echo), 0);
}

TEST_F(DispatcherTest, StopCancelsInFlightCalls) {
    start({blockingTool()});
    initialize();
    client->Send(id(5), "tools/call", Obj({{"name", S("block")}, {"arguments", JSONValue{JSONValue::Object{}}}}));
    // Wait until the call is running
    for (int i = 0; i < 200 && context->Supervisor().GetStats().running == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(context->Supervisor().GetStats().running, 1u);
    server->Stop().get();
    auto r = client->Wait(id(5));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::Cancelled);
}

TEST_F(DispatcherTest, ParseErrorRespondsWithNullId) {
    start();
    client->SendRaw("{not json");
    auto r = client->Wait(JSONRPCId{nullptr});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::ParseError);
}

TEST_F(DispatcherTest, InvalidUtf8IsParseError) {
    start();
    client->SendRaw("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\",\"params\":{\"name\":\"a\xff\"}}");
    auto r = client->Wait(JSONRPCId{nullptr});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::ParseError);
    EXPECT_FALSE(client->Wait(id(1), std::chrono::milliseconds(100)).has_value());
}

TEST_F(DispatcherTest, NonObjectMessageIsInvalidRequest) {
    start();
    client->SendRaw("[1,2,3]");
    auto r = client->Wait(JSONRPCId{nullptr});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ErrorCode(*r), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(DispatcherTest, ClientResponsesAreIgnored) {
    start();
    client->SendRaw(R"({"jsonrpc":"2.0","id":99,"result":{}})");
    auto r = client->Call(id(100), "ping");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(client->Count(), 1u);
}

TEST_F(DispatcherTest, ResourcesListAndRead) {
    start();
    initialize();
    auto list = client->Call(id(1), "resources/list");
    ASSERT_TRUE(list.has_value() && list->result.has_value()) << (list ? list->Serialize() : "");
    const auto& items = arrayAt(list->result.value(), "items");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(textAt(*items[0], "uri"), "workspace://a.txt");
    EXPECT_EQ(textAt(*items[1], "uri"), "workspace://lib/b.dart");

    auto read = client->Call(id(2), "resources/read", Obj({{"uri", S("workspace://a.txt")}, {"start", I(6)}, {"length", I(5)}}));
    ASSERT_TRUE(read.has_value() && read->result.has_value());
    EXPECT_EQ(textAt(read->result.value(), "content"), "world");

    auto escape = client->Call(id(3), "resources/read", Obj({{"uri", S("workspace://../outside.txt")}}));
    ASSERT_TRUE(escape.has_value());
    EXPECT_EQ(ErrorCode(*escape), JSONRPCErrorCodes::SandboxViolation);

    auto missing = client->Call(id(4), "resources/read", Obj({{"uri", S("ftp://x")}}));
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(ErrorCode(*missing), JSONRPCErrorCodes::ResourceNotFound);

    auto badPage = client->Call(id(5), "resources/list", Obj({{"pageSize", I(0)}}));
    ASSERT_TRUE(badPage.has_value());
    EXPECT_EQ(ErrorCode(*badPage), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatcherTest, ToolCallsAppearInRunLogs) {
    start();
    initialize();
    auto echo = callTool(3, "echo", Obj({{"message", S("logged")}}));
    ASSERT_TRUE(echo.has_value());

    auto list = client->Call(id(4), "resources/list", Obj({{"uri", S("logs://")}}));
    ASSERT_TRUE(list.has_value() && list->result.has_value());
    const auto& items = arrayAt(list->result.value(), "items");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(textAt(*items[0], "uri"), "logs://run/3");

    auto read = client->Call(id(5), "resources/read", Obj({{"uri", S("logs://run/3")}}));
    ASSERT_TRUE(read.has_value() && read->result.has_value());
    EXPECT_NE(textAt(read->result.value(), "content").find("tool=echo"), std::string::npos);
}

TEST_F(DispatcherTest, PromptsListAndGet) {
    start();
    initialize();
    auto list = client->Call(id(1), "prompts/list");
    ASSERT_TRUE(list.has_value() && list->result.has_value());
    const auto& prompts = arrayAt(list->result.value(), "prompts");
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(textAt(*prompts[0], "id"), "scaffold.page");

    auto needs = client->Call(id(2), "prompts/get", Obj({{"id", S("scaffold.page")}}));
    ASSERT_TRUE(needs.has_value() && needs->result.has_value());
    const auto& needed = arrayAt(needs->result.value(), "variablesNeeded");
    ASSERT_EQ(needed.size(), 1u);
    EXPECT_EQ(std::get<std::string>(needed[0]->value), "name");

    auto rendered = client->Call(id(3), "prompts/get", Obj({{"id", S("scaffold.page")}, {"variables", Obj({{"name", S("Home")}})}}));
    ASSERT_TRUE(rendered.has_value() && rendered->result.has_value());
    const std::string text = textAt(rendered->result.value(), "text");
    EXPECT_NE(text.find("\"Home\""), std::string::npos);
    EXPECT_NE(text.find("riverpod"), std::string::npos);

    auto unknown = client->Call(id(4), "prompts/get", Obj({{"id", S("nope")}}));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(ErrorCode(*unknown), JSONRPCErrorCodes::PromptNotFound);
}

TEST_F(DispatcherTest, ProgressTokenEnablesProgressNotifications) {
    std::vector<ToolDefinition> tools;
    tools.push_back(stepsTool());
    start(std::move(tools));
    initialize();

    auto r = client->Call(id(1), "tools/call", Obj({{"name", S("steps")},
                                                     {"arguments", JSONValue{JSONValue::Object{}}},
                                                     {"_meta", Obj({{"progressToken", S("tok-1")}})}}));
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->result.has_value());
    EXPECT_EQ(textAt(*arrayAt(r->result.value(), "content").at(0), "text"), "reported");

    // Notifications precede the response on the same stream
    auto notes = client->Notifications("notifications/progress");
    ASSERT_EQ(notes.size(), 3u);
    const JSONValue& first = notes[0].params.value();
    EXPECT_EQ(textAt(first, "progressToken"), "tok-1");
    EXPECT_DOUBLE_EQ(numberAt(first, "progress"), 1.0);
    EXPECT_DOUBLE_EQ(numberAt(first, "total"), 3.0);
    EXPECT_EQ(textAt(first, "message"), "scanning");
    EXPECT_EQ(FindMember(notes[1].params.value(), "message"), nullptr);
    EXPECT_EQ(textAt(notes[2].params.value(), "message"), "done");

    // Integer tokens are echoed as integers
    auto r2 = client->Call(id(2), "tools/call", Obj({{"name", S("steps")},
                                                      {"_meta", Obj({{"progressToken", I(7)}})}}));
    ASSERT_TRUE(r2.has_value());
    notes = client->Notifications("notifications/progress");
    ASSERT_EQ(notes.size(), 6u);
    EXPECT_EQ(std::get<int64_t>(FindMember(notes[3].params.value(), "progressToken")->value), 7);
}

TEST_F(DispatcherTest, NoProgressNotificationsWithoutToken) {
    std::vector<ToolDefinition> tools;
    tools.push_back(stepsTool());
    start(std::move(tools));
    initialize();

    auto r = callTool(1, "steps", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->result.has_value());
    EXPECT_EQ(textAt(*arrayAt(r->result.value(), "content").at(0), "text"), "silent");

    auto bad = client->Call(id(2), "tools/call", Obj({{"name", S("steps")},
                                                       {"_meta", Obj({{"progressToken", JSONValue(true)}})}}));
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(ErrorCode(*bad), 0);
    EXPECT_TRUE(client->Notifications("notifications/progress").empty());
}
